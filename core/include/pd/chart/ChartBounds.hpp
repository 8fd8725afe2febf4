#pragma once
#include "pd/chart/Candle.hpp"
#include "pd/chart/VisibleRange.hpp"
#include "pd/render/Rect.hpp"

#include <vector>

namespace pd {

// Data-space rectangle (slot index x price) for one frame's visible slice.
// Never cached: build it again whenever the slice changes.
struct ChartBounds {
  double xMin{0}, xMax{1};
  double yMin{0}, yMax{1};

  double xRange() const { return xMax - xMin; }
  double yRange() const { return yMax - yMin; }

  // Higher prices map to smaller pixel y.
  float toPixelY(double value, const Rect& r) const;
  double fromPixelY(float py, const Rect& r) const;

  float toPixelX(double slot, const Rect& r) const;
  double fromPixelX(float px, const Rect& r) const;
};

// Price bounds over candles [range.start, range.end): min low / max high,
// expanded by `padding` of the span on each side. An empty slice yields
// 0..1; a flat slice is widened to a span of 1 before padding.
ChartBounds computePriceBounds(const std::vector<Candle>& series,
                               const VisibleRange& range,
                               double padding = 0.05);

// Largest volume in the slice; 0 when empty.
double maxVolume(const std::vector<Candle>& series, const VisibleRange& range);

} // namespace pd
