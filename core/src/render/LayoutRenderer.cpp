#include "pd/render/LayoutRenderer.hpp"
#include "pd/render/RectRenderer.hpp"
#include "pd/text/FontAtlas.hpp"
#include "pd/text/TextRenderer.hpp"

#include <algorithm>

namespace pd {

TextMeasureFn textMeasureFor(const FontAtlas& atlas) {
  return [&atlas](const TextContent& t, float& w, float& h) {
    atlas.measureText(t.text, t.scale, w, h);
  };
}

Rect contentBox(const LayoutNode& node) {
  const PanelStyle& st = node.style;
  float bw = st.border.style != BorderStyle::None ? st.border.width : 0.0f;
  Rect r = node.frame.toRect();
  float x0 = r.x + st.padding.left + bw;
  float y0 = r.y + st.padding.top + bw;
  float w = r.right() - st.padding.right - bw - x0;
  float h = r.bottom() - st.padding.bottom - bw - y0;
  return Rect{x0, y0, std::max(0.0f, w), std::max(0.0f, h)};
}

Point textAnchor(const LayoutNode& node) {
  const PanelStyle& st = node.style;
  float bw = st.border.style != BorderStyle::None ? st.border.width : 0.0f;
  Rect r = node.frame.toRect();
  float x0 = r.x + st.padding.left + bw;
  float x1 = r.right() - st.padding.right - bw;
  float y0 = r.y + st.padding.top + bw;
  float y1 = r.bottom() - st.padding.bottom - bw;

  Point p;
  switch (node.text.hAlign) {
    case HAlign::Left:   p.x = x0; break;
    case HAlign::Center: p.x = 0.5f * (x0 + x1); break;
    case HAlign::Right:  p.x = x1; break;
  }
  switch (node.text.vAlign) {
    case VAlign::Top:    p.y = y0; break;
    case VAlign::Center: p.y = 0.5f * (y0 + y1); break;
    case VAlign::Bottom: p.y = y1; break;
  }
  return p;
}

void LayoutRenderer::paintNode(const LayoutNode& node, const FontAtlas* atlas,
                               RectBatch& rects, TextBatch& text, bool focused) {
  const PanelStyle& st = node.style;
  Rect r = node.frame.toRect();
  if (st.hasBackground) rects.drawRect(r, st.background);
  if (focused) {
    BorderStyle bs = st.border.style != BorderStyle::None ? st.border.style : BorderStyle::Solid;
    rects.drawBorder(r, std::max(st.border.width, 2.0f), st.focusBorder, bs);
  } else if (st.border.style != BorderStyle::None) {
    rects.drawBorder(r, st.border.width, st.border.color, st.border.style);
  }
  if (node.hasText && atlas && !node.text.text.empty()) {
    Point a = textAnchor(node);
    text.drawText(*atlas, node.text.text, a.x, a.y, node.text.scale, node.text.color,
                  node.text.hAlign, node.text.vAlign);
  }
}

Stats LayoutRenderer::render(const LayoutTree& tree, const FontAtlas& atlas,
                             RectRenderer& rects, TextRenderer& text,
                             int width, int height) {
  stats_ = Stats{};
  width_ = width;
  height_ = height;
  scissor_.setScreenHeight(height);
  if (tree.empty()) return stats_;

  rects.begin();
  text.begin();
  paintSubtree(tree, 0, atlas, rects, text);
  stats_ += rects.end(width_, height_);
  stats_ += text.end(width_, height_);
  scissor_.clear();
  applyScissor(scissor_);
  return stats_;
}

void LayoutRenderer::flush(RectRenderer& rects, TextRenderer& text) {
  stats_ += rects.end(width_, height_);
  stats_ += text.end(width_, height_);
  rects.begin();
  text.begin();
}

void LayoutRenderer::paintSubtree(const LayoutTree& tree, std::uint32_t idx,
                                  const FontAtlas& atlas,
                                  RectRenderer& rects, TextRenderer& text) {
  const LayoutNode& node = tree.node(idx);
  if (node.bounds.w <= 0 || node.bounds.h <= 0) return;

  bool focused = !focused_.empty() && node.style.focusId == focused_;
  paintNode(node, &atlas, rects.batch(), text.batch(), focused);
  if (node.childCount == 0) return;

  const bool clips = node.style.clip || node.style.scrollable;
  if (clips) {
    flush(rects, text);
    Rect box = node.bounds.toRect();
    if (node.style.scrollable) box = box.intersect(contentBox(node));
    scissor_.push(box);
    applyScissor(scissor_);
  }
  for (std::uint32_t c = 0; c < node.childCount; c++) {
    paintSubtree(tree, node.firstChild + c, atlas, rects, text);
  }
  if (clips) {
    flush(rects, text);
    scissor_.pop();
    applyScissor(scissor_);
  }
}

} // namespace pd
