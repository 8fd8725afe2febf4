#pragma once
#include "pd/render/Rect.hpp"
#include "pd/style/Color.hpp"

#include <cstddef>
#include <vector>

namespace pd {

// Interleaved x, y, r, g, b, a; drawn as GL_TRIANGLES.
struct ColorVertex {
  float x, y;
  float r, g, b, a;
};

// Untextured triangle accumulator shared by the rect and chart batches.
//
// begin() clears and arms the batch; finish() disarms it and clears. A
// finish() without a preceding begin() returns false and touches nothing,
// so a second end-of-frame flush cannot draw stale geometry.
class ColorBatch {
public:
  void begin();
  bool finish();
  bool active() const { return active_; }

  void addVertex(float x, float y, const Color& c);
  void addTriangle(const Point& p0, const Point& p1, const Point& p2, const Color& c);

  // Quad p0-p1-p2-p3 in winding order, split along p0-p2.
  void addQuad(const Point& p0, const Point& p1, const Point& p2, const Point& p3,
               const Color& c);
  void addRect(const Rect& r, const Color& c);

  const std::vector<ColorVertex>& vertices() const { return verts_; }
  std::size_t vertexCount() const { return verts_.size(); }
  std::size_t triangleCount() const { return verts_.size() / 3; }
  bool empty() const { return verts_.empty(); }

private:
  std::vector<ColorVertex> verts_;
  bool active_{false};
};

} // namespace pd
