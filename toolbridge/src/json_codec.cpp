#include "json_codec.hpp"

namespace toolbridge::codec {

namespace {

constexpr const char* kJsonRpcVersion = "2.0";

Method decode_call_tool(const nlohmann::json& params, std::optional<ErrorPayload>& envelope_error) {
    CallToolMethod call;

    auto name_it = params.find("name");
    if (name_it == params.end() || !name_it->is_string()) {
        envelope_error = ErrorPayload{ErrorCode::InvalidParams, "Missing required parameter: name",
                                      nlohmann::json{{"parameter", "name"}}};
        return call;
    }
    call.name = name_it->get<std::string>();
    if (call.name.empty()) {
        envelope_error = ErrorPayload{ErrorCode::InvalidParams, "Tool name cannot be empty",
                                      nlohmann::json{{"parameter", "name"}}};
        return call;
    }

    auto args_it = params.find("arguments");
    if (args_it != params.end() && !args_it->is_null()) {
        if (!args_it->is_object()) {
            envelope_error = ErrorPayload{ErrorCode::InvalidParams, "arguments must be an object",
                                          nlohmann::json{{"parameter", "arguments"}}};
            return call;
        }
        call.arguments = *args_it;
    }
    return call;
}

} // namespace

Request decode_request(const nlohmann::json& message) {
    if (!message.is_object()) {
        throw DecodeError("envelope is not a JSON object");
    }

    Request request;
    if (auto id_it = message.find("id"); id_it != message.end()) {
        request.has_id = true;
        if (id_it->is_string() || id_it->is_number() || id_it->is_null()) {
            request.id = *id_it;
        } else {
            request.envelope_error = ErrorPayload{ErrorCode::InvalidRequest, "id must be a string or a number", nullptr};
        }
    }

    auto method_it = message.find("method");
    if (method_it == message.end() || !method_it->is_string()) {
        if (!request.has_id) {
            throw DecodeError("envelope has neither an id nor a method");
        }
        if (!request.envelope_error) {
            request.envelope_error = ErrorPayload{ErrorCode::InvalidRequest, "Missing method", nullptr};
        }
        request.method = UnknownMethod{};
        return request;
    }
    request.method_name = method_it->get<std::string>();

    nlohmann::json params = nlohmann::json::object();
    if (auto params_it = message.find("params"); params_it != message.end() && !params_it->is_null()) {
        params = *params_it;
    }

    if (request.method_name == "initialize") {
        request.method = InitializeMethod{};
    } else if (request.method_name == "ping") {
        request.method = PingMethod{};
    } else if (request.method_name == "tools/list") {
        request.method = ListToolsMethod{};
    } else if (request.method_name == "tools/call") {
        if (!params.is_object()) {
            if (!request.envelope_error) {
                request.envelope_error = ErrorPayload{ErrorCode::InvalidParams, "params must be an object", nullptr};
            }
            request.method = CallToolMethod{};
        } else {
            std::optional<ErrorPayload> params_error;
            request.method = decode_call_tool(params, params_error);
            if (!request.envelope_error) {
                request.envelope_error = std::move(params_error);
            }
        }
    } else {
        request.method = UnknownMethod{request.method_name};
    }
    return request;
}

Request decode_line(const std::string& line) {
    nlohmann::json::parser_callback_t limit_depth = [](int depth, nlohmann::json::parse_event_t,
                                                       nlohmann::json&) {
        if (depth > kMaxNestingDepth) {
            throw DecodeError("nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels");
        }
        return true;
    };
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line, limit_depth);
    } catch (const nlohmann::json::parse_error& e) {
        throw DecodeError(std::string("invalid JSON: ") + e.what());
    }
    return decode_request(message);
}

nlohmann::json encode_error(const ErrorPayload& error) {
    nlohmann::json encoded = {
        {"code", static_cast<int>(error.code)},
        {"message", error.message},
    };
    if (!error.data.is_null()) {
        encoded["data"] = error.data;
    }
    return encoded;
}

nlohmann::json encode_response(const Response& response) {
    nlohmann::json encoded = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", response.id},
    };
    if (response.error) {
        encoded["error"] = encode_error(*response.error);
    } else {
        encoded["result"] = response.result.value_or(nlohmann::json::object());
    }
    return encoded;
}

std::string dump_compact(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string encode_line(const Response& response) {
    return dump_compact(encode_response(response));
}

} // namespace toolbridge::codec
