#include "tool_base.hpp"

namespace toolbridge::tools {

ToolOutcome ok(nlohmann::json item) {
    Payload payload;
    payload.push_back(std::move(item));
    return payload;
}

ToolOutcome ok_items(Payload items) {
    return items;
}

ToolOutcome fail(std::string message) {
    return ToolError{ToolErrorKind::Failure, std::move(message), nullptr};
}

ToolOutcome not_found(std::string message) {
    return ToolError{ToolErrorKind::NotFound, std::move(message), nullptr};
}

ToolOutcome execution_failed(std::string message, nlohmann::json data) {
    return ToolError{ToolErrorKind::Execution, std::move(message), std::move(data)};
}

ToolOutcome cancelled(std::string message) {
    return ToolError{ToolErrorKind::Cancelled, std::move(message), nullptr};
}

const char* error_kind_name(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::Failure:
            return "failure";
        case ToolErrorKind::InvalidArgument:
            return "invalid_argument";
        case ToolErrorKind::NotFound:
            return "not_found";
        case ToolErrorKind::Execution:
            return "execution";
        case ToolErrorKind::Cancelled:
            return "cancelled";
        case ToolErrorKind::Internal:
            return "internal";
    }
    return "unknown";
}

} // namespace toolbridge::tools
