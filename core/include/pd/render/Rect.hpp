#pragma once
#include <algorithm>

namespace pd {

struct Point {
  float x{0}, y{0};
};

// Axis-aligned rectangle in pixels, origin top-left, y grows downward.
struct Rect {
  float x{0}, y{0}, w{0}, h{0};

  float right() const { return x + w; }
  float bottom() const { return y + h; }
  bool empty() const { return w <= 0.0f || h <= 0.0f; }

  bool contains(float px, float py) const {
    return px >= x && px < right() && py >= y && py < bottom();
  }

  // Overlap of two rects; zero-sized when they do not overlap.
  Rect intersect(const Rect& o) const {
    float x0 = std::max(x, o.x);
    float y0 = std::max(y, o.y);
    float x1 = std::min(right(), o.right());
    float y1 = std::min(bottom(), o.bottom());
    return Rect{x0, y0, std::max(0.0f, x1 - x0), std::max(0.0f, y1 - y0)};
  }
};

} // namespace pd
