#pragma once

#include "tool_base.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolbridge::tools {

class DuplicateToolError : public std::logic_error {
public:
    explicit DuplicateToolError(const std::string& name)
        : std::logic_error("tool already registered: " + name) {}
};

/**
 * Populated once at startup, read-only afterwards.
 * Listing order is registration order.
 */
class ToolRegistry {
public:
    /// @throws DuplicateToolError when the name is taken
    void add(std::unique_ptr<ToolHandler> handler);
    ToolHandler* find(const std::string& name) const;
    std::vector<const ToolDescriptor*> list() const;
    size_t size() const { return handlers_.size(); }

private:
    std::vector<std::unique_ptr<ToolHandler>> handlers_;
    std::unordered_map<std::string, ToolHandler*> index_;
};

void register_apk_tools(ToolRegistry& registry);
void register_project_tools(ToolRegistry& registry);
void register_builtin_tools(ToolRegistry& registry);

} // namespace toolbridge::tools
