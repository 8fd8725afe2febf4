#pragma once
#include "pd/render/ColorPipeline.hpp"
#include "pd/render/RectBatch.hpp"

namespace pd {

// begin() -> drawRect / drawBorder ... -> end(width, height).
// end() without an open batch is a no-op.
class RectRenderer {
public:
  Status init() { return pipeline_.init("rects"); }

  void begin() { batch_.begin(); }
  Stats end(int width, int height);

  void drawRect(const Rect& r, const Color& c) { batch_.drawRect(r, c); }
  void drawBorder(const Rect& r, float width, const Color& c,
                  BorderStyle style = BorderStyle::Solid) {
    batch_.drawBorder(r, width, c, style);
  }

  RectBatch& batch() { return batch_; }

private:
  RectBatch batch_;
  ColorPipeline pipeline_;
};

} // namespace pd
