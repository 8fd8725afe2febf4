#include "pd/render/ColorBatch.hpp"

namespace pd {

void ColorBatch::begin() {
  verts_.clear();
  active_ = true;
}

bool ColorBatch::finish() {
  if (!active_) return false;
  active_ = false;
  verts_.clear();
  return true;
}

void ColorBatch::addVertex(float x, float y, const Color& c) {
  verts_.push_back(ColorVertex{x, y, c.r, c.g, c.b, c.a});
}

void ColorBatch::addTriangle(const Point& p0, const Point& p1, const Point& p2,
                             const Color& c) {
  addVertex(p0.x, p0.y, c);
  addVertex(p1.x, p1.y, c);
  addVertex(p2.x, p2.y, c);
}

void ColorBatch::addQuad(const Point& p0, const Point& p1, const Point& p2,
                         const Point& p3, const Color& c) {
  addTriangle(p0, p1, p2, c);
  addTriangle(p0, p2, p3, c);
}

void ColorBatch::addRect(const Rect& r, const Color& c) {
  if (r.w <= 0.0f || r.h <= 0.0f) return;
  addQuad(Point{r.x, r.y}, Point{r.right(), r.y},
          Point{r.right(), r.bottom()}, Point{r.x, r.bottom()}, c);
}

} // namespace pd
