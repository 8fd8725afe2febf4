#include "pd/chart/VisibleRange.hpp"

#include <algorithm>
#include <cmath>

namespace pd {

std::size_t slotsForWidth(float width, float slotWidth) {
  if (!(slotWidth > 0.0f) || !(width > 0.0f)) return 1;
  auto n = static_cast<std::size_t>(std::floor(width / slotWidth));
  return std::max<std::size_t>(1, n);
}

VisibleRange computeVisibleRange(std::size_t total, std::size_t slots, long scrollOffset) {
  VisibleRange r;
  r.slots = std::max<std::size_t>(1, slots);

  // Scrolling stops once only the oldest sample is left in view.
  std::size_t maxOffset = total > 0 ? total - 1 : 0;
  std::size_t offset = scrollOffset > 0 ? static_cast<std::size_t>(scrollOffset) : 0;
  r.offset = std::min(offset, maxOffset);

  r.end = total - r.offset;
  r.start = r.end > r.slots ? r.end - r.slots : 0;
  r.leftPad = r.slots - r.count();
  return r;
}

} // namespace pd
