#pragma once
#include "pd/layout/Style.hpp"
#include "pd/render/ColorBatch.hpp"

namespace pd {

constexpr float kDashLength = 10.0f;
constexpr float kDashGap = 5.0f;

// Filled and bordered axis-aligned rects for UI panels.
class RectBatch {
public:
  void begin() { geom_.begin(); }
  bool finish() { return geom_.finish(); }
  bool active() const { return geom_.active(); }

  void drawRect(const Rect& r, const Color& c) { geom_.addRect(r, c); }
  void drawRect(float x, float y, float w, float h, const Color& c) {
    geom_.addRect(Rect{x, y, w, h}, c);
  }

  // Border drawn inside `r`. Solid = 4 edge rects; Dashed uses
  // kDashLength / kDashGap; Dotted uses dot = width, gap = 2 * width.
  void drawBorder(const Rect& r, float width, const Color& c, BorderStyle style);

  // Thick axis-aligned line segments, optionally dashed.
  void drawLineH(float x, float y, float length, float thickness, const Color& c);
  void drawLineV(float x, float y, float length, float thickness, const Color& c);
  void drawDashedLineH(float x, float y, float length, float thickness,
                       float dash, float gap, const Color& c);
  void drawDashedLineV(float x, float y, float length, float thickness,
                       float dash, float gap, const Color& c);

  const ColorBatch& geometry() const { return geom_; }

private:
  ColorBatch geom_;
};

} // namespace pd
