#include "dispatcher.hpp"

#include "json_codec.hpp"
#include "logger.hpp"

#include <atomic>
#include <future>
#include <memory>

#include <log4cplus/loggingmacros.h>

namespace toolbridge {

namespace {

nlohmann::json content_entry(const nlohmann::json& item) {
    return {
        {"type", "text"},
        {"text", item.is_string() ? item.get<std::string>() : codec::dump_compact(item)},
    };
}

} // namespace

Dispatcher::Dispatcher(const tools::ToolRegistry& registry, tools::ToolContext& context)
    : registry_(registry), context_(context) {}

Dispatcher::~Dispatcher() {
    join_stragglers();
}

std::optional<Response> Dispatcher::dispatch(const Request& request) {
    if (!request.has_id) {
        LOG4CPLUS_DEBUG(dispatch_logger(), "Notification " << request.method_name << " ignored");
        return std::nullopt;
    }

    const nlohmann::json& id = request.id;
    if (request.envelope_error) {
        const auto& error = *request.envelope_error;
        LOG4CPLUS_WARN(dispatch_logger(), "Rejected request id=" << id.dump() << ": " << error.message);
        return make_error(id, error.code, error.message, error.data);
    }

    LOG4CPLUS_DEBUG(dispatch_logger(), "Request " << request.method_name << " id=" << id.dump());

    try {
        if (std::holds_alternative<InitializeMethod>(request.method)) {
            return initialize(id);
        }
        if (std::holds_alternative<PingMethod>(request.method)) {
            return make_result(id, nlohmann::json::object());
        }
        if (std::holds_alternative<ListToolsMethod>(request.method)) {
            return list_tools(id);
        }
        if (const auto* call = std::get_if<CallToolMethod>(&request.method)) {
            return call_tool(id, *call);
        }
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(dispatch_logger(), "Internal error serving " << request.method_name << ": " << e.what());
        return make_error(id, ErrorCode::InternalError, std::string("Internal error: ") + e.what());
    }

    LOG4CPLUS_WARN(dispatch_logger(), "Method not found: " << request.method_name);
    return make_error(id, ErrorCode::MethodNotFound, "Method not found: " + request.method_name);
}

Response Dispatcher::initialize(const nlohmann::json& id) const {
    const auto& config = context_.config;
    LOG4CPLUS_INFO(dispatch_logger(), "Received initialize request, responding with capabilities: tools");
    return make_result(id, {
        {"protocolVersion", config.protocol_version},
        {"capabilities", {
            {"tools", {{"listChanged", false}}},
        }},
        {"serverInfo", {
            {"name", config.server_name},
            {"version", config.server_version},
        }},
    });
}

Response Dispatcher::list_tools(const nlohmann::json& id) const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto* descriptor : registry_.list()) {
        tools.push_back(tools::describe(*descriptor));
    }
    return make_result(id, {{"tools", std::move(tools)}});
}

Response Dispatcher::call_tool(const nlohmann::json& id, const CallToolMethod& call) {
    tools::ToolHandler* handler = registry_.find(call.name);
    if (!handler) {
        LOG4CPLUS_WARN(dispatch_logger(), "Unknown tool: " << call.name);
        return make_error(id, ErrorCode::MethodNotFound, "Unknown tool: " + call.name);
    }

    tools::ToolArguments arguments;
    try {
        arguments = tools::validate_arguments(handler->descriptor(), call.arguments);
    } catch (const tools::ValidationError& e) {
        LOG4CPLUS_WARN(dispatch_logger(), call.name << ": " << e.what());
        return make_error(id, ErrorCode::InvalidParams, e.what(), {{"parameter", e.parameter()}});
    }

    LOG4CPLUS_INFO(dispatch_logger(), "tools/call " << call.name << " id=" << id.dump());
    auto started = std::chrono::steady_clock::now();
    tools::ToolOutcome outcome = invoke(*handler, arguments);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    if (const auto* error = std::get_if<tools::ToolError>(&outcome)) {
        LOG4CPLUS_WARN(dispatch_logger(), call.name << " failed (" << tools::error_kind_name(error->kind) << ") after "
                       << elapsed.count() << " ms: " << error->message);
    } else {
        LOG4CPLUS_INFO(dispatch_logger(), call.name << " completed in " << elapsed.count() << " ms");
    }
    return to_response(id, outcome);
}

tools::ToolOutcome Dispatcher::invoke(tools::ToolHandler& handler, const tools::ToolArguments& arguments) {
    const auto window = window_for(handler);
    if (window.count() <= 0) {
        CancellationToken never_cancelled;
        return invoke_guarded(handler, arguments, never_cancelled);
    }

    reap_stragglers();

    auto token = std::make_shared<CancellationToken>();
    auto finished = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<tools::ToolOutcome>>();
    std::future<tools::ToolOutcome> future = promise->get_future();

    std::thread worker([this, &handler, arguments, token, finished, promise]() {
        promise->set_value(invoke_guarded(handler, arguments, *token));
        finished->store(true);
    });

    if (future.wait_for(window) == std::future_status::ready) {
        worker.join();
        return future.get();
    }

    token->cancel();
    LOG4CPLUS_WARN(dispatch_logger(), handler.name() << " exceeded its " << window.count()
                   << " ms window, cancellation requested");
    {
        std::lock_guard<std::mutex> lock(stragglers_mutex_);
        stragglers_.push_back(Straggler{std::move(worker), finished});
    }
    return tools::cancelled(handler.name() + " timed out after " + std::to_string(window.count()) + " ms");
}

tools::ToolOutcome Dispatcher::invoke_guarded(tools::ToolHandler& handler, const tools::ToolArguments& arguments,
                                              const CancellationToken& cancel) {
    const std::string& name = handler.name();
    try {
        tools::ToolCall call{name, context_, arguments, cancel};
        return handler.handle(call);
    } catch (const tools::ValidationError& e) {
        return tools::ToolError{tools::ToolErrorKind::InvalidArgument, e.what(), {{"parameter", e.parameter()}}};
    } catch (const ProcessError& e) {
        LOG4CPLUS_ERROR(dispatch_logger(), name << ": cannot start process: " << e.what());
        return tools::ToolError{tools::ToolErrorKind::Execution, std::string("Failed to start process: ") + e.what(),
                                nullptr};
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(dispatch_logger(), name << " threw: " << e.what());
        return tools::ToolError{tools::ToolErrorKind::Internal, "Unexpected error in " + name + ": " + e.what(),
                                nullptr};
    } catch (...) {
        LOG4CPLUS_ERROR(dispatch_logger(), name << " threw a non-standard exception");
        return tools::ToolError{tools::ToolErrorKind::Internal, "Unexpected error in " + name, nullptr};
    }
}

std::chrono::milliseconds Dispatcher::window_for(const tools::ToolHandler& handler) const {
    const auto& timeout = handler.descriptor().timeout;
    return timeout ? *timeout : context_.config.tool_timeout;
}

void Dispatcher::reap_stragglers() {
    std::lock_guard<std::mutex> lock(stragglers_mutex_);
    for (auto it = stragglers_.begin(); it != stragglers_.end();) {
        if (it->finished->load()) {
            it->thread.join();
            it = stragglers_.erase(it);
        } else {
            ++it;
        }
    }
}

void Dispatcher::join_stragglers() {
    std::vector<Straggler> pending;
    {
        std::lock_guard<std::mutex> lock(stragglers_mutex_);
        pending.swap(stragglers_);
    }
    if (!pending.empty()) {
        LOG4CPLUS_INFO(dispatch_logger(), "Waiting for " << pending.size() << " cancelled tool call(s) to finish");
    }
    for (auto& straggler : pending) {
        if (straggler.thread.joinable()) {
            straggler.thread.join();
        }
    }
}

Response Dispatcher::to_response(const nlohmann::json& id, const tools::ToolOutcome& outcome) {
    if (const auto* error = std::get_if<tools::ToolError>(&outcome)) {
        return make_error(id, error_code_for(error->kind), error->message, error->data);
    }

    nlohmann::json content = nlohmann::json::array();
    for (const auto& item : std::get<tools::Payload>(outcome)) {
        content.push_back(content_entry(item));
    }
    return make_result(id, {{"content", std::move(content)}, {"isError", false}});
}

ErrorCode Dispatcher::error_code_for(tools::ToolErrorKind kind) {
    switch (kind) {
        case tools::ToolErrorKind::Failure:
        case tools::ToolErrorKind::Execution:
            return ErrorCode::ToolFailure;
        case tools::ToolErrorKind::InvalidArgument:
            return ErrorCode::InvalidParams;
        case tools::ToolErrorKind::NotFound:
            return ErrorCode::ResourceNotFound;
        case tools::ToolErrorKind::Cancelled:
            return ErrorCode::Cancelled;
        case tools::ToolErrorKind::Internal:
            return ErrorCode::InternalError;
    }
    return ErrorCode::InternalError;
}

} // namespace toolbridge
