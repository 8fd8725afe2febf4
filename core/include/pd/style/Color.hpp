#pragma once

namespace pd {

// Linear RGBA, each channel in [0..1].
struct Color {
  float r{0}, g{0}, b{0}, a{1};

  Color withAlpha(float alpha) const { return Color{r, g, b, alpha}; }
};

inline bool operator==(const Color& x, const Color& y) {
  return x.r == y.r && x.g == y.g && x.b == y.b && x.a == y.a;
}
inline bool operator!=(const Color& x, const Color& y) { return !(x == y); }

} // namespace pd
