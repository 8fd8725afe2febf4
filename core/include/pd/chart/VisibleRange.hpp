#pragma once
#include <cstddef>

namespace pd {

// Contiguous slice [start, end) of a series plus the number of empty
// slots on the left when the series is shorter than the viewport.
struct VisibleRange {
  std::size_t start{0};
  std::size_t end{0};
  std::size_t slots{1};
  std::size_t leftPad{0};
  std::size_t offset{0};   // scroll offset after clamping

  std::size_t count() const { return end - start; }
  bool empty() const { return end == start; }

  // Slot index (0 = leftmost) that sample `i` of the series lands in.
  std::size_t slotOf(std::size_t i) const { return leftPad + (i - start); }
};

// Number of whole slots of `slotWidth` that fit in `width`; at least 1.
std::size_t slotsForWidth(float width, float slotWidth);

// Offset counts samples back from the most recent (0 = newest at the right
// edge). Negative offsets clamp to 0 and offsets clamp above to total - 1,
// which leaves the oldest sample alone in the rightmost slot with the rest
// of the viewport padded on the left.
VisibleRange computeVisibleRange(std::size_t total, std::size_t slots, long scrollOffset);

} // namespace pd
