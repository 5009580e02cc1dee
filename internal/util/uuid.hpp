#pragma once

#include <string>

namespace engram::util {

// Random RFC4122 v4 UUID in canonical 8-4-4-4-12 form; fresh relationship ids.
std::string GenerateUUIDString();

} // namespace engram::util
