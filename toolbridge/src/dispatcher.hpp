#pragma once

#include "protocol.hpp"
#include "tool/tool_base.hpp"
#include "tool/tool_registry.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace toolbridge {

/**
 * Turns one decoded request into exactly one response.
 *
 * Tool handlers run behind a failure boundary: exceptions, failed
 * subprocesses and expired execution windows all become error responses.
 * dispatch() itself does not throw for handler faults.
 */
class Dispatcher {
public:
    Dispatcher(const tools::ToolRegistry& registry, tools::ToolContext& context);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Returns nothing for notifications (requests without an id).
    std::optional<Response> dispatch(const Request& request);

    /// Runs one tool call inside the failure boundary and execution window.
    tools::ToolOutcome invoke(tools::ToolHandler& handler, const tools::ToolArguments& arguments);

    static Response to_response(const nlohmann::json& id, const tools::ToolOutcome& outcome);
    static ErrorCode error_code_for(tools::ToolErrorKind kind);

private:
    Response initialize(const nlohmann::json& id) const;
    Response list_tools(const nlohmann::json& id) const;
    Response call_tool(const nlohmann::json& id, const CallToolMethod& call);

    tools::ToolOutcome invoke_guarded(tools::ToolHandler& handler, const tools::ToolArguments& arguments,
                                      const CancellationToken& cancel);
    std::chrono::milliseconds window_for(const tools::ToolHandler& handler) const;
    void reap_stragglers();
    void join_stragglers();

    struct Straggler {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    const tools::ToolRegistry& registry_;
    tools::ToolContext& context_;

    // Timed-out calls that are still unwinding after cancellation.
    std::mutex stragglers_mutex_;
    std::vector<Straggler> stragglers_;
};

} // namespace toolbridge
