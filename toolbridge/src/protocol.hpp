#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace toolbridge {

enum class ErrorCode : int {
    ToolFailure = -1,
    ResourceNotFound = -32002,
    Cancelled = -32800,
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,
};

struct ErrorPayload {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    nlohmann::json data; // null when there is nothing to attach
};

struct InitializeMethod {};

struct PingMethod {};

struct ListToolsMethod {};

struct CallToolMethod {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct UnknownMethod {
    std::string method;
};

/// Top-level methods, decoded once at the transport boundary.
using Method = std::variant<InitializeMethod, PingMethod, ListToolsMethod, CallToolMethod, UnknownMethod>;

struct Request {
    nlohmann::json id;      // string or number, echoed back verbatim
    bool has_id = false;    // false for notifications
    std::string method_name;
    Method method;

    /// Set when the envelope parsed but cannot be served; answered without dispatching.
    std::optional<ErrorPayload> envelope_error;
};

struct Response {
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<ErrorPayload> error;
};

inline Response make_result(const nlohmann::json& id, nlohmann::json result) {
    Response response;
    response.id = id;
    response.result = std::move(result);
    return response;
}

inline Response make_error(const nlohmann::json& id, ErrorCode code, std::string message,
                           nlohmann::json data = nullptr) {
    Response response;
    response.id = id;
    response.error = ErrorPayload{code, std::move(message), std::move(data)};
    return response;
}

} // namespace toolbridge
