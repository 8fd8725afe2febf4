#include "pd/text/Utf8.hpp"

namespace pd {

namespace {

// Smallest codepoint each sequence length may carry; anything below is overlong.
const std::uint32_t kMinForLength[5] = {0, 0, 0x80, 0x800, 0x10000};

bool isScalarValue(std::uint32_t cp) {
  return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

} // namespace

std::vector<std::uint32_t> decodeUtf8(const std::string& text) {
  std::vector<std::uint32_t> out;
  out.reserve(text.size());

  const auto* s = reinterpret_cast<const unsigned char*>(text.data());
  const std::size_t n = text.size();
  std::size_t i = 0;
  while (i < n) {
    unsigned char b = s[i];
    std::uint32_t cp = 0;
    std::size_t len = 0;
    if (b < 0x80)                { cp = b;        len = 1; }
    else if ((b & 0xE0) == 0xC0) { cp = b & 0x1F; len = 2; }
    else if ((b & 0xF0) == 0xE0) { cp = b & 0x0F; len = 3; }
    else if ((b & 0xF8) == 0xF0) { cp = b & 0x07; len = 4; }
    else { i++; continue; }

    if (i + len > n) { i++; continue; }
    bool ok = true;
    for (std::size_t k = 1; k < len; k++) {
      if ((s[i + k] & 0xC0) != 0x80) { ok = false; break; }
      cp = (cp << 6) | (s[i + k] & 0x3F);
    }
    if (!ok || cp < kMinForLength[len] || !isScalarValue(cp)) { i++; continue; }

    out.push_back(cp);
    i += len;
  }
  return out;
}

} // namespace pd
