#include <gtest/gtest.h>

#include "json_codec.hpp"
#include "msgpack_codec.hpp"

#include <msgpack.hpp>

#include <functional>
#include <string>

using namespace toolbridge;
using nlohmann::json;

namespace {

std::string pack(const std::function<void(msgpack::packer<msgpack::sbuffer>&)>& pack_fn) {
    msgpack::sbuffer buffer;
    msgpack::packer<msgpack::sbuffer> pk(&buffer);
    pack_fn(pk);
    return std::string(buffer.data(), buffer.size());
}

} // namespace

TEST(MsgpackCodec, DecodesRequestFrame) {
    std::string frame = pack([](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_map(4);
        pk.pack("jsonrpc");
        pk.pack("2.0");
        pk.pack("id");
        pk.pack(7);
        pk.pack("method");
        pk.pack("tools/call");
        pk.pack("params");
        pk.pack_map(2);
        pk.pack("name");
        pk.pack("find_classes");
        pk.pack("arguments");
        pk.pack_map(2);
        pk.pack("pattern");
        pk.pack("Main");
        pk.pack("limit");
        pk.pack(-1);
    });

    json message = codec::decode_msgpack(frame);

    EXPECT_EQ(message["id"], 7);
    EXPECT_EQ(message["params"]["arguments"]["pattern"], "Main");
    EXPECT_EQ(message["params"]["arguments"]["limit"], -1);

    Request request = codec::decode_request(message);
    ASSERT_TRUE(std::holds_alternative<CallToolMethod>(request.method));
}

TEST(MsgpackCodec, DecodesScalarsAndNil) {
    std::string frame = pack([](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_array(4);
        pk.pack_nil();
        pk.pack(true);
        pk.pack(1.5);
        pk.pack(std::string("text"));
    });

    EXPECT_EQ(codec::decode_msgpack(frame), json::parse(R"([null,true,1.5,"text"])"));
}

TEST(MsgpackCodec, BinaryBecomesByteArray) {
    std::string frame = pack([](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_bin(3);
        pk.pack_bin_body("\x01\x02\x03", 3);
    });

    EXPECT_EQ(codec::decode_msgpack(frame), json::array({1, 2, 3}));
}

TEST(MsgpackCodec, EncodedResponseDecodesBack) {
    json response = codec::encode_response(make_result("r-1", {{"content", json::array({{{"type", "text"}, {"text", "hi"}}})}}));

    json decoded = codec::decode_msgpack(codec::encode_msgpack(response));

    EXPECT_EQ(decoded, response);
}

TEST(MsgpackCodec, TruncatedFrameThrowsDecodeError) {
    std::string frame = pack([](msgpack::packer<msgpack::sbuffer>& pk) {
        pk.pack_map(1);
        pk.pack("method");
        pk.pack("ping");
    });
    frame.resize(frame.size() - 2);

    EXPECT_THROW(codec::decode_msgpack(frame), codec::DecodeError);
}

TEST(MsgpackCodec, OverDeepFrameThrowsDecodeError) {
    // 0x91 is a one-element fixarray; 0xc0 is nil.
    std::string frame(100000, '\x91');
    frame.push_back('\xc0');

    EXPECT_THROW(codec::decode_msgpack(frame), codec::DecodeError);
}
