#pragma once

#include "tool_schema.hpp"

#include "../cancellation.hpp"
#include "../process_runner.hpp"
#include "../project_store.hpp"
#include "../server_config.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace toolbridge::tools {

/// Server-wide collaborators handed to every tool call; nothing is read from globals.
struct ToolContext {
    const ServerConfig& config;
    ProcessRunner& runner;
    project::ProjectSession& project;
};

struct ToolCall {
    const std::string& tool;
    ToolContext& context;
    const ToolArguments& arguments;
    const CancellationToken& cancel;
};

enum class ToolErrorKind {
    Failure,
    InvalidArgument,
    NotFound,
    Execution,
    Cancelled,
    Internal,
};

struct ToolError {
    ToolErrorKind kind = ToolErrorKind::Failure;
    std::string message;
    nlohmann::json data;
};

/// Ordered result items; a single value is a one-item payload.
using Payload = std::vector<nlohmann::json>;
using ToolOutcome = std::variant<Payload, ToolError>;

ToolOutcome ok(nlohmann::json item);
ToolOutcome ok_items(Payload items);
ToolOutcome fail(std::string message);
ToolOutcome not_found(std::string message);
ToolOutcome execution_failed(std::string message, nlohmann::json data = nullptr);
ToolOutcome cancelled(std::string message);

inline bool is_ok(const ToolOutcome& outcome) {
    return std::holds_alternative<Payload>(outcome);
}

const char* error_kind_name(ToolErrorKind kind);

class ToolHandler {
public:
    virtual ~ToolHandler() = default;
    virtual const ToolDescriptor& descriptor() const = 0;
    virtual ToolOutcome handle(ToolCall& call) = 0;

    const std::string& name() const { return descriptor().name; }
};

/**
 * Handler whose arguments are converted into a typed struct first.
 * Args must provide: static Args from(const ToolArguments&, const ToolContext&)
 */
template <typename Args>
class TypedToolHandler : public ToolHandler {
public:
    explicit TypedToolHandler(ToolDescriptor descriptor) : descriptor_(std::move(descriptor)) {}

    const ToolDescriptor& descriptor() const override { return descriptor_; }

    ToolOutcome handle(ToolCall& call) override {
        return run(Args::from(call.arguments, call.context), call);
    }

protected:
    virtual ToolOutcome run(const Args& args, ToolCall& call) = 0;

private:
    ToolDescriptor descriptor_;
};

/// Adapts a callable; used by embedding hosts that register ad-hoc tools.
class FunctionToolHandler final : public ToolHandler {
public:
    using Function = std::function<ToolOutcome(ToolCall&)>;

    FunctionToolHandler(ToolDescriptor descriptor, Function fn)
        : descriptor_(std::move(descriptor)), fn_(std::move(fn)) {}

    const ToolDescriptor& descriptor() const override { return descriptor_; }
    ToolOutcome handle(ToolCall& call) override { return fn_(call); }

private:
    ToolDescriptor descriptor_;
    Function fn_;
};

} // namespace toolbridge::tools
