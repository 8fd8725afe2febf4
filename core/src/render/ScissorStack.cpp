#include "pd/render/ScissorStack.hpp"

#include <glad/gles2.h>

#include <cmath>

namespace pd {

void ScissorStack::push(const Rect& r) {
  stack_.push_back(stack_.empty() ? r : stack_.back().intersect(r));
}

void ScissorStack::pop() {
  if (!stack_.empty()) stack_.pop_back();
}

ScissorBox ScissorStack::glBox() const {
  ScissorBox b;
  if (stack_.empty()) return b;
  const Rect& r = stack_.back();
  b.x = static_cast<int>(std::floor(r.x));
  b.y = static_cast<int>(std::floor(static_cast<float>(screenH_) - r.bottom()));
  b.w = static_cast<int>(std::ceil(r.w));
  b.h = static_cast<int>(std::ceil(r.h));
  return b;
}

void applyScissor(const ScissorStack& stack) {
  if (!stack.active()) {
    glDisable(GL_SCISSOR_TEST);
    return;
  }
  ScissorBox b = stack.glBox();
  glEnable(GL_SCISSOR_TEST);
  glScissor(b.x, b.y, b.w, b.h);
}

} // namespace pd
