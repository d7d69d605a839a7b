#pragma once

#include <msgpack.hpp>
#include <nlohmann/json.hpp>

#include <string>

namespace toolbridge::codec {

nlohmann::json to_json(const msgpack::object& obj);
void pack_json(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value);

/// Decodes one MessagePack frame body; throws DecodeError on malformed input.
nlohmann::json decode_msgpack(const std::string& bytes);
std::string encode_msgpack(const nlohmann::json& value);

} // namespace toolbridge::codec
