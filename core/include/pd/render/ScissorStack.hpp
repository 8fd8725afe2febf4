#pragma once
#include "pd/render/Rect.hpp"

#include <cstddef>
#include <vector>

namespace pd {

// Scissor rectangle in GL window coordinates (origin bottom-left).
struct ScissorBox {
  int x{0}, y{0}, w{0}, h{0};
};

// Nested clip rects in top-left pixel space. Each push is intersected
// with the current top; pop restores the previous rect. CPU only:
// applyScissor() hands the top to GL.
class ScissorStack {
public:
  void setScreenHeight(int h) { screenH_ = h; }

  void push(const Rect& r);
  void pop();
  void clear() { stack_.clear(); }

  bool active() const { return !stack_.empty(); }
  std::size_t depth() const { return stack_.size(); }
  const Rect& current() const { return stack_.back(); }

  // Top of the stack, flipped to bottom-left origin and grown to whole pixels.
  ScissorBox glBox() const;

private:
  std::vector<Rect> stack_;
  int screenH_{0};
};

// Enables GL_SCISSOR_TEST with the stack top, or disables it when empty.
// Requires a current GL context.
void applyScissor(const ScissorStack& stack);

} // namespace pd
