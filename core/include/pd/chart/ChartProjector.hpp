#pragma once
#include "pd/chart/Candle.hpp"
#include "pd/chart/ChartBounds.hpp"
#include "pd/chart/VisibleRange.hpp"
#include "pd/render/Rect.hpp"
#include "pd/style/Theme.hpp"

#include <cstdint>
#include <vector>

namespace pd {

class ChartBatch;

enum class ChartStyle : std::uint8_t { Line, Candlestick };

struct ChartStyleConfig {
  float slotWidth{8.0f};           // pixels per sample
  double pricePadding{0.05};       // fraction of price span on each side
  float volumeHeightRatio{0.15f};  // bottom share of the rect for volume
  float bodyWidthRatio{0.95f};     // candle body / slot
  float wickWidthRatio{0.1f};      // wick / body, at least 1 px
  int gridHLines{4};
  int gridVLines{6};
  float gridAlpha{0.3f};
  float volumeBarRatio{0.6f};      // volume bar / slot
  float volumeAlpha{0.4f};
  float lineThickness{2.0f};
  float markerRadius{3.0f};
};

struct CandleShape {
  float x{0};
  float openY{0}, highY{0}, lowY{0}, closeY{0};
  float bodyWidth{0}, wickWidth{0};
  bool bullish{true};
  Color color{};
};

struct VolumeBarShape {
  float x{0}, bottomY{0}, height{0}, width{0};
  Color color{};
};

// Pixel-space output of one chart projection.
struct ChartPrimitives {
  ChartStyle style{ChartStyle::Candlestick};
  Rect priceRect;
  Rect volumeRect;
  VisibleRange range;
  ChartBounds bounds;
  double volumeMax{0.0};
  float slotPixels{0.0f};

  // Grid over priceRect
  int gridHLines{0};
  int gridVLines{0};
  Color gridColor{};

  std::vector<CandleShape> candles;       // Candlestick style

  std::vector<Point> line;                // Line style
  float lineThickness{0.0f};
  Color lineColor{};
  Color areaTop{};
  Color areaBottom{};
  bool hasMarker{false};
  Point marker;
  float markerRadius{0.0f};

  std::vector<VolumeBarShape> volumeBars;
};

// Projects the visible slice of `series` into `rect`. Bounds and the
// volume scale come from the visible slice only and are rebuilt on
// every call.
ChartPrimitives projectChart(const std::vector<Candle>& series, const Rect& rect,
                             ChartStyle style, long scrollOffset,
                             const Theme& theme, const ChartStyleConfig& cfg);

// Center x of a slot within `r` for a viewport of `slots` slots.
float slotCenterX(const Rect& r, std::size_t slot, std::size_t slots);

// Replays projected primitives into a chart batch.
void submitChart(const ChartPrimitives& prims, ChartBatch& batch);

} // namespace pd
