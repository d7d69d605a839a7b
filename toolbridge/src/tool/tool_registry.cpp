#include "tool_registry.hpp"

namespace toolbridge::tools {

void ToolRegistry::add(std::unique_ptr<ToolHandler> handler) {
    if (!handler) {
        return;
    }
    const std::string& name = handler->name();
    if (index_.count(name)) {
        throw DuplicateToolError(name);
    }
    index_.emplace(name, handler.get());
    handlers_.push_back(std::move(handler));
}

ToolHandler* ToolRegistry::find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<const ToolDescriptor*> ToolRegistry::list() const {
    std::vector<const ToolDescriptor*> descriptors;
    descriptors.reserve(handlers_.size());
    for (const auto& handler : handlers_) {
        descriptors.push_back(&handler->descriptor());
    }
    return descriptors;
}

void register_builtin_tools(ToolRegistry& registry) {
    register_apk_tools(registry);
    register_project_tools(registry);
}

} // namespace toolbridge::tools
