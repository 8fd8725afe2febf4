#pragma once
#include "pd/style/Color.hpp"
#include "pd/text/TextAlign.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pd {

class FontAtlas;

// Interleaved x, y, u, v, r, g, b, a; 6 vertices per glyph quad.
struct TextVertex {
  float x, y;
  float u, v;
  float r, g, b, a;
};

// CPU accumulator for glyph quads from a single atlas.
//
// Precondition: begin() once per frame before drawing. finish() disarms
// and clears; repeated finish() calls are no-ops returning false.
class TextBatch {
public:
  void begin();
  bool finish();
  bool active() const { return active_; }

  // Appends one quad per drawable glyph. (x, y) is the anchor: hAlign
  // picks which edge of the measured run sits at x, vAlign which edge of
  // the text box sits at y. rotation (radians, clockwise on screen)
  // turns the run about the anchor. Glyphs absent from the atlas are
  // skipped and advance nothing.
  void drawText(const FontAtlas& atlas, const std::string& text,
                float x, float y, float scale, const Color& color,
                HAlign hAlign = HAlign::Left, VAlign vAlign = VAlign::Top,
                float rotation = 0.0f);

  const std::vector<TextVertex>& vertices() const { return verts_; }
  std::size_t quadCount() const { return verts_.size() / 6; }
  bool empty() const { return verts_.empty(); }

  // Atlas the accumulated quads sample from; nullptr while empty.
  const FontAtlas* atlas() const { return atlas_; }

private:
  std::vector<TextVertex> verts_;
  const FontAtlas* atlas_{nullptr};
  bool active_{false};
};

} // namespace pd
