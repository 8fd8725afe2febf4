#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pd {

// Decodes UTF-8 into codepoints. Malformed, truncated and overlong
// sequences, surrogates and values above U+10FFFF are dropped byte by byte.
std::vector<std::uint32_t> decodeUtf8(const std::string& text);

} // namespace pd
