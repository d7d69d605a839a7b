#pragma once

#include "ipc_server.hpp"
#include "protocol.hpp"

#include <functional>
#include <optional>
#include <string>

namespace toolbridge {

using DispatchFn = std::function<std::optional<Response>(const Request&)>;

/// Decodes one MessagePack frame, dispatches it and encodes the reply.
/// Undecodable frames are logged and produce no reply.
std::optional<std::string> handle_frame(const std::string& frame, const DispatchFn& dispatch);

IpcServer::RequestHandler make_frame_handler(DispatchFn dispatch);

} // namespace toolbridge
