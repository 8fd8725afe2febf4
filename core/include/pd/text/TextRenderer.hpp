#pragma once
#include "pd/debug/Stats.hpp"
#include "pd/gl/ShaderProgram.hpp"
#include "pd/gl/StreamBuffer.hpp"
#include "pd/text/TextBatch.hpp"

namespace pd {

class FontAtlas;

// Textured glyph quads, one draw per end(). The atlas image is uploaded
// the first time an atlas is drawn with and again only if a different
// atlas shows up.
class TextRenderer {
public:
  TextRenderer() = default;
  ~TextRenderer();

  TextRenderer(const TextRenderer&) = delete;
  TextRenderer& operator=(const TextRenderer&) = delete;

  Status init();

  // Precondition: one begin() per end(); a second begin() discards
  // whatever was accumulated.
  void begin() { batch_.begin(); }

  void drawText(const FontAtlas& atlas, const std::string& text,
                float x, float y, float scale, const Color& color,
                HAlign hAlign = HAlign::Left, VAlign vAlign = VAlign::Top,
                float rotation = 0.0f) {
    batch_.drawText(atlas, text, x, y, scale, color, hAlign, vAlign, rotation);
  }

  Stats end(int width, int height);

  TextBatch& batch() { return batch_; }

private:
  std::uint64_t uploadAtlas(const FontAtlas& atlas);

  TextBatch batch_;
  ShaderProgram program_;
  StreamBuffer vbo_;
  GLuint texture_{0};
  const FontAtlas* uploaded_{nullptr};

  GLint uProj_{-1};
  GLint uAtlas_{-1};
};

} // namespace pd
