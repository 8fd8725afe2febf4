#include "pd/text/TextBatch.hpp"
#include "pd/text/FontAtlas.hpp"
#include "pd/text/Utf8.hpp"

#include <cmath>
#include <cstdio>

namespace pd {

void TextBatch::begin() {
  verts_.clear();
  atlas_ = nullptr;
  active_ = true;
}

bool TextBatch::finish() {
  if (!active_) return false;
  active_ = false;
  verts_.clear();
  atlas_ = nullptr;
  return true;
}

void TextBatch::drawText(const FontAtlas& atlas, const std::string& text,
                         float x, float y, float scale, const Color& color,
                         HAlign hAlign, VAlign vAlign, float rotation) {
  if (text.empty() || !atlas.built()) return;
  if (atlas_ && atlas_ != &atlas) {
    std::fprintf(stderr, "TextBatch: second atlas in one batch, text skipped\n");
    return;
  }

  float textW = 0, textH = 0;
  atlas.measureText(text, scale, textW, textH);
  if (textW <= 0.0f) return;

  float penX = x;
  switch (hAlign) {
    case HAlign::Left:   break;
    case HAlign::Center: penX = x - textW * 0.5f; break;
    case HAlign::Right:  penX = x - textW; break;
  }

  // Baseline from the requested box edge.
  float asc = atlas.ascent() * scale;
  float baseline = y + asc;
  switch (vAlign) {
    case VAlign::Top:    break;
    case VAlign::Center: baseline = y - textH * 0.5f + asc; break;
    case VAlign::Bottom: baseline = y + atlas.descent() * scale; break;
  }

  const bool rotated = rotation != 0.0f;
  const float cs = std::cos(rotation);
  const float sn = std::sin(rotation);
  auto emit = [&](float px, float py, float u, float v) {
    if (rotated) {
      float dx = px - x, dy = py - y;
      px = x + dx * cs - dy * sn;
      py = y + dx * sn + dy * cs;
    }
    verts_.push_back(TextVertex{px, py, u, v, color.r, color.g, color.b, color.a});
  };

  for (std::uint32_t cp : decodeUtf8(text)) {
    const GlyphInfo* g = atlas.getGlyph(cp);
    if (!g) continue;

    if (g->w > 0.0f && g->h > 0.0f) {
      float x0 = penX + g->bearingX * scale;
      float y0 = baseline - g->bearingY * scale;
      float x1 = x0 + g->w * scale;
      float y1 = y0 + g->h * scale;

      emit(x0, y0, g->u0, g->v0);
      emit(x1, y0, g->u1, g->v0);
      emit(x1, y1, g->u1, g->v1);
      emit(x0, y0, g->u0, g->v0);
      emit(x1, y1, g->u1, g->v1);
      emit(x0, y1, g->u0, g->v1);
      atlas_ = &atlas;
    }
    penX += g->advance * scale;
  }
}

} // namespace pd
