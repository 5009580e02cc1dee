#pragma once

#include <cstdint>
#include <string>

namespace engram::util {

// Wall clock in Unix milliseconds; the timestamp unit of entities and records.
uint64_t NowMillis();

// RFC 3339 UTC, e.g. 2024-01-01T10:05:00.000Z
std::string FormatUnixMillis(uint64_t ms);

} // namespace engram::util
