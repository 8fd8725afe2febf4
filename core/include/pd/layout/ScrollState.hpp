#pragma once

namespace pd {

// Scroll position of one scrollable panel, in pixels along its main axis.
// The offset stays in [0, maxOffset()] whatever the extents do.
class ScrollState {
public:
  explicit ScrollState(float lineHeight = 30.0f) : lineHeight_(lineHeight) {}

  // Content and viewport lengths, usually LayoutNode::contentLength and
  // LayoutNode::viewportLength of the panel after a layout pass.
  void setExtent(float content, float viewport);

  void scrollLines(int lines);   // positive scrolls down
  void scrollPages(int pages);   // one page is 90% of the viewport
  void toTop() { offset_ = 0.0f; }
  void toBottom() { offset_ = maxOffset(); }
  void setOffset(float offset);

  // Smallest move that brings [start, start + length) into view. A span
  // longer than the viewport is aligned to its start.
  void ensureVisible(float start, float length);

  float offset() const { return offset_; }
  float maxOffset() const;
  bool canScroll() const { return maxOffset() > 0.0f; }
  float progress() const;  // 0 at the top, 1 at the bottom

private:
  void clamp();

  float offset_{0.0f};
  float content_{0.0f};
  float viewport_{0.0f};
  float lineHeight_;
};

} // namespace pd
