#pragma once

#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <string>

namespace toolbridge::codec {

/// Raised for input that cannot be turned into an envelope at all (no id to answer).
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Deepest array/object nesting accepted on either wire format.
constexpr int kMaxNestingDepth = 128;

Request decode_request(const nlohmann::json& message);
Request decode_line(const std::string& line);

nlohmann::json encode_error(const ErrorPayload& error);
nlohmann::json encode_response(const Response& response);

/// Compact single-line JSON; invalid UTF-8 from tool output is replaced, never thrown on.
std::string dump_compact(const nlohmann::json& value);
std::string encode_line(const Response& response);

} // namespace toolbridge::codec
