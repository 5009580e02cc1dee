#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <string_view>

namespace engram::entity {

/*
  Canonical JSON.

  The byte form every entity version is hashed in, so it must be
  deterministic:
    - object keys sorted bytewise, no insignificant whitespace
    - integral numbers below 2^53 printed without fraction or exponent,
      other numbers with %.17g
    - strings escaped per RFC 8259, control characters as \u00XX
  NaN and infinities are rejected with ValidationError.
*/

std::string CanonicalJson(const google::protobuf::Value& value);
std::string CanonicalJson(const google::protobuf::Struct& value);

// Throws util::ValidationError("json", ...) on malformed input.
google::protobuf::Value ParseJson(std::string_view json);

bool SameValue(const google::protobuf::Value& a, const google::protobuf::Value& b);

} // namespace engram::entity
