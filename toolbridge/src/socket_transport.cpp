#include "socket_transport.hpp"

#include "json_codec.hpp"
#include "logger.hpp"
#include "msgpack_codec.hpp"

#include <log4cplus/loggingmacros.h>

namespace toolbridge {

std::optional<std::string> handle_frame(const std::string& frame, const DispatchFn& dispatch) {
    Request request;
    try {
        request = codec::decode_request(codec::decode_msgpack(frame));
    } catch (const codec::DecodeError& e) {
        LOG4CPLUS_WARN(transport_logger(), "Dropping malformed frame: " << e.what());
        return std::nullopt;
    }

    std::optional<Response> response;
    try {
        response = dispatch(request);
    } catch (const std::exception& e) {
        LOG4CPLUS_ERROR(transport_logger(), "Dispatch failed for " << request.method_name << ": " << e.what());
        if (!request.has_id) {
            return std::nullopt;
        }
        response = make_error(request.id, ErrorCode::InternalError, std::string("Internal error: ") + e.what());
    }

    if (!response) {
        return std::nullopt;
    }
    return codec::encode_msgpack(codec::encode_response(*response));
}

IpcServer::RequestHandler make_frame_handler(DispatchFn dispatch) {
    return [dispatch = std::move(dispatch)](const std::string& request_bytes) {
        return handle_frame(request_bytes, dispatch);
    };
}

} // namespace toolbridge
