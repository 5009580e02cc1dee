#pragma once

#include <string_view>

namespace engram::util {

// Well-formed UTF-8 per RFC 3629: no overlong forms, surrogates or code
// points above U+10FFFF.
bool IsValidUtf8(std::string_view bytes);

} // namespace engram::util
