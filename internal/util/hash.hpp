#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace engram::util {

/*
  Content digests.

  Objects are addressed by the lowercase hex SHA-256 of their exact bytes
  (64 characters).
*/

inline constexpr std::size_t kDigestHexLength = 64;

std::string Sha256Hex(const uint8_t* data, std::size_t size);
std::string Sha256Hex(std::string_view bytes);

bool IsDigest(std::string_view value);

} // namespace engram::util
