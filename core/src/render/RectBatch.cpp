#include "pd/render/RectBatch.hpp"

#include <algorithm>

namespace pd {

void RectBatch::drawLineH(float x, float y, float length, float thickness, const Color& c) {
  geom_.addRect(Rect{x, y, length, thickness}, c);
}

void RectBatch::drawLineV(float x, float y, float length, float thickness, const Color& c) {
  geom_.addRect(Rect{x, y, thickness, length}, c);
}

void RectBatch::drawDashedLineH(float x, float y, float length, float thickness,
                                float dash, float gap, const Color& c) {
  if (dash <= 0.0f) return;
  float end = x + length;
  for (float pos = x; pos < end; pos += dash + gap) {
    geom_.addRect(Rect{pos, y, std::min(dash, end - pos), thickness}, c);
  }
}

void RectBatch::drawDashedLineV(float x, float y, float length, float thickness,
                                float dash, float gap, const Color& c) {
  if (dash <= 0.0f) return;
  float end = y + length;
  for (float pos = y; pos < end; pos += dash + gap) {
    geom_.addRect(Rect{x, pos, thickness, std::min(dash, end - pos)}, c);
  }
}

void RectBatch::drawBorder(const Rect& r, float width, const Color& c, BorderStyle style) {
  if (style == BorderStyle::None || width <= 0.0f || r.empty()) return;
  float bw = std::min(width, 0.5f * std::min(r.w, r.h));
  float innerH = r.h - 2.0f * bw;

  switch (style) {
    case BorderStyle::Solid:
      drawLineH(r.x, r.y, r.w, bw, c);
      drawLineH(r.x, r.bottom() - bw, r.w, bw, c);
      drawLineV(r.x, r.y + bw, innerH, bw, c);
      drawLineV(r.right() - bw, r.y + bw, innerH, bw, c);
      break;
    case BorderStyle::Dashed:
    case BorderStyle::Dotted: {
      float dash = style == BorderStyle::Dashed ? kDashLength : bw;
      float gap = style == BorderStyle::Dashed ? kDashGap : 2.0f * bw;
      drawDashedLineH(r.x, r.y, r.w, bw, dash, gap, c);
      drawDashedLineH(r.x, r.bottom() - bw, r.w, bw, dash, gap, c);
      drawDashedLineV(r.x, r.y + bw, innerH, bw, dash, gap, c);
      drawDashedLineV(r.right() - bw, r.y + bw, innerH, bw, dash, gap, c);
      break;
    }
    case BorderStyle::None:
      break;
  }
}

} // namespace pd
