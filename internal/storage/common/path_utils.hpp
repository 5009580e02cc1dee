#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace engram::storage::common {

inline void ValidateDigest(const std::string& digest) {
  if (!engram::util::IsDigest(digest)) {
    throw engram::util::InvalidInput("object digest must be 64 lowercase hex characters: '" + digest + "'");
  }
}

/*
  objects/<aa>/<bb>/<digest>

  Two levels of fan-out keep directory sizes bounded.
*/
inline std::filesystem::path ObjectPath(const std::filesystem::path& root, const std::string& digest) {
  ValidateDigest(digest);
  return root / "objects" / digest.substr(0, 2) / digest.substr(2, 2) / digest;
}

} // namespace engram::storage::common
