#include "pd/layout/ScrollState.hpp"

#include <algorithm>

namespace pd {

void ScrollState::setExtent(float content, float viewport) {
  content_ = std::max(0.0f, content);
  viewport_ = std::max(0.0f, viewport);
  clamp();
}

void ScrollState::scrollLines(int lines) {
  setOffset(offset_ + static_cast<float>(lines) * lineHeight_);
}

void ScrollState::scrollPages(int pages) {
  setOffset(offset_ + static_cast<float>(pages) * viewport_ * 0.9f);
}

void ScrollState::setOffset(float offset) {
  offset_ = offset;
  clamp();
}

void ScrollState::ensureVisible(float start, float length) {
  float end = start + std::max(0.0f, length);
  if (start < offset_ || end - start > viewport_) {
    setOffset(start);
  } else if (end > offset_ + viewport_) {
    setOffset(end - viewport_);
  }
}

float ScrollState::maxOffset() const {
  return std::max(0.0f, content_ - viewport_);
}

float ScrollState::progress() const {
  float m = maxOffset();
  return m > 0.0f ? offset_ / m : 0.0f;
}

void ScrollState::clamp() {
  offset_ = std::min(std::max(offset_, 0.0f), maxOffset());
}

} // namespace pd
