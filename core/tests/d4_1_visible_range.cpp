// D4.1: Visible range
// Tests:
//   1. 100 candles, 20 slots, offset 0 -> [80, 100), no padding
//   2. 5 candles, 20 slots -> all 5, 15 left-pad slots, newest in the last slot
//   3. Negative offsets clamp to 0
//   4. Offsets clamp to total - 1; scrolling past the oldest page pads on the left
//   5. Same inputs give the same range
//   6. slotsForWidth and slot centers

#include "pd/chart/ChartProjector.hpp"
#include "pd/chart/VisibleRange.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requireClose(double a, double b, double eps, const char* msg) {
  if (std::fabs(a - b) > eps) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.6f, expected %.6f)\n", msg, a, b);
    std::exit(1);
  }
}

static bool sameRange(const pd::VisibleRange& a, const pd::VisibleRange& b) {
  return a.start == b.start && a.end == b.end && a.slots == b.slots &&
         a.leftPad == b.leftPad && a.offset == b.offset;
}

int main() {
  // --- Test 1: full viewport ---
  {
    pd::VisibleRange r = pd::computeVisibleRange(100, 20, 0);
    requireTrue(r.start == 80 && r.end == 100, "slice 80..100");
    requireTrue(r.count() == 20, "20 visible");
    requireTrue(r.leftPad == 0, "no padding");
    requireTrue(r.slotOf(99) == 19, "newest in the last slot");
    requireTrue(r.slotOf(80) == 0, "oldest in the first slot");

    r = pd::computeVisibleRange(100, 20, 30);
    requireTrue(r.start == 50 && r.end == 70, "scrolled back 30");
    std::printf("  Test 1 (100 candles / 20 slots): PASS\n");
  }

  // --- Test 2: short series ---
  {
    pd::VisibleRange r = pd::computeVisibleRange(5, 20, 0);
    requireTrue(r.start == 0 && r.end == 5, "all 5 visible");
    requireTrue(r.leftPad == 15, "15 empty slots on the left");
    requireTrue(r.slotOf(4) == 19, "newest right-aligned");
    requireTrue(r.slotOf(0) == 15, "oldest after the padding");

    pd::Rect rect{0, 0, 160, 100};
    float lastCenter = pd::slotCenterX(rect, r.slotOf(4), r.slots);
    requireClose(lastCenter, 160.0 - 4.0, 1e-4, "rightmost candle at the right edge");

    pd::VisibleRange scrolled = pd::computeVisibleRange(5, 20, 3);
    requireTrue(scrolled.offset == 3, "short series still scrolls");
    requireTrue(scrolled.start == 0 && scrolled.end == 2, "two oldest candles left");
    requireTrue(scrolled.leftPad == 18, "18 empty slots on the left");
    requireTrue(scrolled.slotOf(1) == 19, "newest shown candle in the last slot");

    pd::VisibleRange far = pd::computeVisibleRange(5, 20, 50);
    requireTrue(far.offset == 4 && far.count() == 1, "clamped to the oldest candle");

    pd::VisibleRange none = pd::computeVisibleRange(0, 20, 0);
    requireTrue(none.empty() && none.leftPad == 20, "empty series");
    std::printf("  Test 2 (short series): PASS\n");
  }

  // --- Test 3: negative offsets ---
  {
    pd::VisibleRange zero = pd::computeVisibleRange(100, 20, 0);
    for (long off : {-1L, -5L, -1000L, -2147483647L}) {
      pd::VisibleRange r = pd::computeVisibleRange(100, 20, off);
      requireTrue(sameRange(r, zero), "negative offset same as 0");
      requireTrue(r.offset == 0, "clamped offset reported");
    }
    std::printf("  Test 3 (negative clamp): PASS\n");
  }

  // --- Test 4: upper clamp ---
  {
    pd::VisibleRange r = pd::computeVisibleRange(100, 20, 500);
    requireTrue(r.offset == 99, "clamped to total - 1");
    requireTrue(r.start == 0 && r.end == 1, "only the oldest candle");
    requireTrue(r.leftPad == 19, "rest of the viewport empty");
    requireTrue(r.slotOf(0) == 19, "oldest candle right-aligned");

    r = pd::computeVisibleRange(100, 20, 90);
    requireTrue(r.offset == 90, "offset kept");
    requireTrue(r.start == 0 && r.end == 10, "ten oldest candles");
    requireTrue(r.leftPad == 10, "ten empty slots on the left");

    r = pd::computeVisibleRange(100, 20, 80);
    requireTrue(r.start == 0 && r.end == 20 && r.leftPad == 0, "oldest full page");
    std::printf("  Test 4 (upper clamp): PASS\n");
  }

  // --- Test 5: idempotence ---
  {
    for (std::size_t total : {0u, 1u, 7u, 20u, 21u, 1000u}) {
      for (long off : {-3L, 0L, 1L, 15L, 999L}) {
        pd::VisibleRange a = pd::computeVisibleRange(total, 20, off);
        pd::VisibleRange b = pd::computeVisibleRange(total, 20, off);
        requireTrue(sameRange(a, b), "same inputs, same range");
        // Feeding back the clamped offset is a fixed point
        pd::VisibleRange c = pd::computeVisibleRange(total, 20, static_cast<long>(a.offset));
        requireTrue(sameRange(a, c), "clamped offset is stable");
        requireTrue(a.count() + a.leftPad == a.slots, "count + pad fills slots");
      }
    }
    std::printf("  Test 5 (idempotence): PASS\n");
  }

  // --- Test 6: slots and centers ---
  {
    requireTrue(pd::slotsForWidth(160.0f, 8.0f) == 20, "160 / 8");
    requireTrue(pd::slotsForWidth(167.0f, 8.0f) == 20, "floor");
    requireTrue(pd::slotsForWidth(3.0f, 8.0f) == 1, "at least one slot");
    requireTrue(pd::slotsForWidth(100.0f, 0.0f) == 1, "zero slot width");
    requireTrue(pd::computeVisibleRange(10, 0, 0).slots == 1, "zero slots -> 1");

    pd::Rect rect{10, 0, 100, 50};
    requireClose(pd::slotCenterX(rect, 0, 10), 15.0, 1e-5, "first center");
    requireClose(pd::slotCenterX(rect, 9, 10), 105.0, 1e-5, "last center");
    std::printf("  Test 6 (slots and centers): PASS\n");
  }

  std::printf("D4.1 visible range: ALL PASS\n");
  return 0;
}
