#pragma once
#include "pd/debug/Stats.hpp"
#include "pd/layout/LayoutTree.hpp"
#include "pd/render/ScissorStack.hpp"

#include <string>

namespace pd {

class FontAtlas;
class RectBatch;
class RectRenderer;
class TextBatch;
class TextRenderer;

// Measures text panels against an atlas for LayoutTree::compute().
TextMeasureFn textMeasureFor(const FontAtlas& atlas);

// Anchor point for a node's text inside its padded, bordered box.
Point textAnchor(const LayoutNode& node);

// Padded, bordered box of a node's frame; the scissor of scrollable panels.
Rect contentBox(const LayoutNode& node);

// Paints a computed tree depth-first: background, border, text, then
// children. Nodes with clip set flush both batches and scissor their
// subtree. The panel whose focus id matches setFocused() gets its border
// drawn in its focus color, at least 2 px wide.
class LayoutRenderer {
public:
  void setFocused(std::string id) { focused_ = std::move(id); }
  const std::string& focused() const { return focused_; }

  Stats render(const LayoutTree& tree, const FontAtlas& atlas,
               RectRenderer& rects, TextRenderer& text, int width, int height);

  // One node's own visuals, without children or clipping.
  static void paintNode(const LayoutNode& node, const FontAtlas* atlas,
                        RectBatch& rects, TextBatch& text, bool focused = false);

private:
  void paintSubtree(const LayoutTree& tree, std::uint32_t idx, const FontAtlas& atlas,
                    RectRenderer& rects, TextRenderer& text);
  void flush(RectRenderer& rects, TextRenderer& text);

  ScissorStack scissor_;
  std::string focused_;
  Stats stats_;
  int width_{0};
  int height_{0};
};

} // namespace pd
