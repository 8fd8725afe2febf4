#include "pd/chart/ChartBounds.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace pd {

float ChartBounds::toPixelY(double value, const Rect& r) const {
  double span = yRange();
  double t = span != 0.0 ? (value - yMin) / span : 0.5;
  return r.y + static_cast<float>(static_cast<double>(r.h) * (1.0 - t));
}

double ChartBounds::fromPixelY(float py, const Rect& r) const {
  if (r.h == 0.0f) return yMin;
  double t = 1.0 - static_cast<double>(py - r.y) / static_cast<double>(r.h);
  return yMin + t * yRange();
}

float ChartBounds::toPixelX(double slot, const Rect& r) const {
  double span = xRange();
  double t = span != 0.0 ? (slot - xMin) / span : 0.5;
  return r.x + static_cast<float>(static_cast<double>(r.w) * t);
}

double ChartBounds::fromPixelX(float px, const Rect& r) const {
  if (r.w == 0.0f) return xMin;
  double t = static_cast<double>(px - r.x) / static_cast<double>(r.w);
  return xMin + t * xRange();
}

ChartBounds computePriceBounds(const std::vector<Candle>& series,
                               const VisibleRange& range,
                               double padding) {
  ChartBounds b;
  b.xMin = 0.0;
  b.xMax = static_cast<double>(range.slots);

  std::size_t end = std::min(range.end, series.size());
  if (range.start >= end) {
    b.yMin = 0.0;
    b.yMax = 1.0;
    return b;
  }

  double lo = std::numeric_limits<double>::max();
  double hi = std::numeric_limits<double>::lowest();
  for (std::size_t i = range.start; i < end; i++) {
    lo = std::min(lo, series[i].low);
    hi = std::max(hi, series[i].high);
  }

  double span = hi - lo;
  if (span < 1e-12) {
    double mid = 0.5 * (lo + hi);
    lo = mid - 0.5;
    hi = mid + 0.5;
    span = 1.0;
  }

  double margin = span * padding;
  b.yMin = lo - margin;
  b.yMax = hi + margin;
  return b;
}

double maxVolume(const std::vector<Candle>& series, const VisibleRange& range) {
  double m = 0.0;
  std::size_t end = std::min(range.end, series.size());
  for (std::size_t i = range.start; i < end; i++) m = std::max(m, series[i].volume);
  return m;
}

} // namespace pd
