#include "pd/views/Format.hpp"

#include <cmath>
#include <cstdint>
#include <cstdio>

namespace pd {

namespace {

std::string withCommas(std::uint64_t n) {
  std::string digits = std::to_string(n);
  std::string out;
  out.reserve(digits.size() + digits.size() / 3);
  std::size_t lead = digits.size() % 3;
  for (std::size_t i = 0; i < digits.size(); i++) {
    if (i > 0 && (i % 3) == lead % 3) out.push_back(',');
    out.push_back(digits[i]);
  }
  return out;
}

std::string printf1(const char* fmt, double v) {
  char buf[64];
  std::snprintf(buf, sizeof(buf), fmt, v);
  return buf;
}

} // namespace

std::string formatPrice(double price) {
  if (price >= 1000.0) {
    // Round to cents first so 999.999 carries into the whole part.
    auto cents = static_cast<std::uint64_t>(std::llround(price * 100.0));
    char frac[8];
    std::snprintf(frac, sizeof(frac), "%02u", static_cast<unsigned>(cents % 100));
    return "$" + withCommas(cents / 100) + "." + frac;
  }
  if (price >= 1.0) return printf1("$%.2f", price);
  if (price >= 0.01) return printf1("$%.4f", price);
  return printf1("$%.6f", price);
}

std::string formatPriceShort(double price) {
  if (price >= 1000.0) return printf1("$%.0fk", price / 1000.0);
  if (price >= 1.0) return printf1("$%.0f", price);
  return printf1("$%.2f", price);
}

std::string formatChange(double changePercent) {
  return printf1("%+.2f%%", changePercent);
}

std::string formatVolume(double volumeUsd) {
  if (volumeUsd >= 1e9) return printf1("$%.1fB", volumeUsd / 1e9);
  if (volumeUsd >= 1e6) return printf1("$%.0fM", volumeUsd / 1e6);
  if (volumeUsd >= 1e3) return printf1("$%.0fK", volumeUsd / 1e3);
  return printf1("$%.0f", volumeUsd);
}

} // namespace pd
