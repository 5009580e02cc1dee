#include "utf8.hpp"

#include <cstddef>

namespace engram::util {

bool IsValidUtf8(std::string_view bytes) {
  const auto* p   = reinterpret_cast<const unsigned char*>(bytes.data());
  const auto  end = p + bytes.size();

  while (p < end) {
    const unsigned char lead = *p;
    if (lead < 0x80) {
      ++p;
      continue;
    }

    std::size_t   trail = 0;
    unsigned char lo    = 0x80;
    unsigned char hi    = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
      trail = 1;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      trail = 2;
      if (lead == 0xE0) lo = 0xA0; // overlong
      if (lead == 0xED) hi = 0x9F; // surrogates
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      trail = 3;
      if (lead == 0xF0) lo = 0x90; // overlong
      if (lead == 0xF4) hi = 0x8F; // above U+10FFFF
    } else {
      return false;
    }

    if (static_cast<std::size_t>(end - p) <= trail) return false;
    // only the first continuation byte has a narrowed range
    if (p[1] < lo || p[1] > hi) return false;
    for (std::size_t i = 2; i <= trail; ++i) {
      if (p[i] < 0x80 || p[i] > 0xBF) return false;
    }
    p += trail + 1;
  }
  return true;
}

} // namespace engram::util
