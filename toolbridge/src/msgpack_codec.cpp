#include "msgpack_codec.hpp"

#include "json_codec.hpp"

#include <cstddef>
#include <cstdint>

namespace toolbridge::codec {

namespace {

nlohmann::json bytes_to_json(const char* ptr, uint32_t size) {
    nlohmann::json bytes = nlohmann::json::array();
    for (uint32_t i = 0; i < size; ++i) {
        bytes.push_back(static_cast<uint8_t>(ptr[i]));
    }
    return bytes;
}

} // namespace

nlohmann::json to_json(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return nullptr;
        case msgpack::type::BOOLEAN:
            return obj.via.boolean;
        case msgpack::type::POSITIVE_INTEGER:
            return obj.via.u64;
        case msgpack::type::NEGATIVE_INTEGER:
            return obj.via.i64;
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return obj.via.f64;
        case msgpack::type::STR:
            return std::string(obj.via.str.ptr, obj.via.str.size);
        case msgpack::type::BIN:
            return bytes_to_json(obj.via.bin.ptr, obj.via.bin.size);
        case msgpack::type::EXT:
            return bytes_to_json(obj.via.ext.data(), obj.via.ext.size);
        case msgpack::type::ARRAY: {
            nlohmann::json array = nlohmann::json::array();
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                array.push_back(to_json(obj.via.array.ptr[i]));
            }
            return array;
        }
        case msgpack::type::MAP: {
            nlohmann::json map = nlohmann::json::object();
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const auto& kv = obj.via.map.ptr[i];
                std::string key;
                if (kv.key.type == msgpack::type::STR) {
                    key.assign(kv.key.via.str.ptr, kv.key.via.str.size);
                } else {
                    key = dump_compact(to_json(kv.key));
                }
                map[key] = to_json(kv.val);
            }
            return map;
        }
    }
    return nullptr;
}

void pack_json(msgpack::packer<msgpack::sbuffer>& pk, const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null:
        case nlohmann::json::value_t::discarded:
            pk.pack_nil();
            break;
        case nlohmann::json::value_t::boolean:
            pk.pack(value.get<bool>());
            break;
        case nlohmann::json::value_t::number_integer:
            pk.pack(value.get<int64_t>());
            break;
        case nlohmann::json::value_t::number_unsigned:
            pk.pack(value.get<uint64_t>());
            break;
        case nlohmann::json::value_t::number_float:
            pk.pack(value.get<double>());
            break;
        case nlohmann::json::value_t::string:
            pk.pack(value.get_ref<const std::string&>());
            break;
        case nlohmann::json::value_t::binary: {
            const auto& bin = value.get_binary();
            pk.pack_bin(static_cast<uint32_t>(bin.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(bin.data()), static_cast<uint32_t>(bin.size()));
            break;
        }
        case nlohmann::json::value_t::array:
            pk.pack_array(static_cast<uint32_t>(value.size()));
            for (const auto& item : value) {
                pack_json(pk, item);
            }
            break;
        case nlohmann::json::value_t::object:
            pk.pack_map(static_cast<uint32_t>(value.size()));
            for (auto it = value.begin(); it != value.end(); ++it) {
                pk.pack(it.key());
                pack_json(pk, it.value());
            }
            break;
    }
}

nlohmann::json decode_msgpack(const std::string& bytes) {
    try {
        msgpack::unpack_limit limit(0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff, 0xffffffff,
                                    static_cast<std::size_t>(kMaxNestingDepth));
        msgpack::object_handle handle = msgpack::unpack(bytes.data(), bytes.size(), nullptr, nullptr, limit);
        return to_json(handle.get());
    } catch (const std::exception& exc) {
        throw DecodeError(std::string("invalid MessagePack frame: ") + exc.what());
    }
}

std::string encode_msgpack(const nlohmann::json& value) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_json(pk, value);
    return std::string(buffer.data(), buffer.size());
}

} // namespace toolbridge::codec
