#include "hash.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace engram::util {

std::string Sha256Hex(const uint8_t* data, std::size_t size) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(data, size, digest);

  std::ostringstream out;
  for (unsigned char byte : digest) {
    out << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return out.str();
}

std::string Sha256Hex(std::string_view bytes) {
  return Sha256Hex(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
}

bool IsDigest(std::string_view value) {
  if (value.size() != kDigestHexLength) {
    return false;
  }
  for (char c : value) {
    const bool hex_digit = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex_digit) {
      return false;
    }
  }
  return true;
}

} // namespace engram::util
