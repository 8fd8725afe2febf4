#include "pd/chart/ChartProjector.hpp"
#include "pd/render/ChartBatch.hpp"

#include <algorithm>

namespace pd {

float slotCenterX(const Rect& r, std::size_t slot, std::size_t slots) {
  float slotW = r.w / static_cast<float>(std::max<std::size_t>(1, slots));
  return r.x + (static_cast<float>(slot) + 0.5f) * slotW;
}

ChartPrimitives projectChart(const std::vector<Candle>& series, const Rect& rect,
                             ChartStyle style, long scrollOffset,
                             const Theme& theme, const ChartStyleConfig& cfg) {
  ChartPrimitives out;
  out.style = style;

  float volumeH = rect.h * std::clamp(cfg.volumeHeightRatio, 0.0f, 1.0f);
  out.priceRect = Rect{rect.x, rect.y, rect.w, rect.h - volumeH};
  out.volumeRect = Rect{rect.x, rect.bottom() - volumeH, rect.w, volumeH};

  out.range = computeVisibleRange(series.size(), slotsForWidth(rect.w, cfg.slotWidth),
                                  scrollOffset);
  out.bounds = computePriceBounds(series, out.range, cfg.pricePadding);
  out.volumeMax = maxVolume(series, out.range);
  out.slotPixels = rect.w / static_cast<float>(out.range.slots);

  out.gridHLines = cfg.gridHLines;
  out.gridVLines = cfg.gridVLines;
  out.gridColor = theme.border.withAlpha(cfg.gridAlpha);

  const Rect& pr = out.priceRect;
  const std::size_t end = std::min(out.range.end, series.size());

  float bodyW = out.slotPixels * cfg.bodyWidthRatio;
  float wickW = std::max(bodyW * cfg.wickWidthRatio, 1.0f);
  float barW = out.slotPixels * cfg.volumeBarRatio;

  for (std::size_t i = out.range.start; i < end; i++) {
    const Candle& c = series[i];
    float x = slotCenterX(rect, out.range.slotOf(i), out.range.slots);
    bool up = isBullish(c);
    Color color = up ? theme.bullish : theme.bearish;

    if (style == ChartStyle::Candlestick) {
      CandleShape s;
      s.x = x;
      s.openY = out.bounds.toPixelY(c.open, pr);
      s.highY = out.bounds.toPixelY(c.high, pr);
      s.lowY = out.bounds.toPixelY(c.low, pr);
      s.closeY = out.bounds.toPixelY(c.close, pr);
      s.bodyWidth = bodyW;
      s.wickWidth = wickW;
      s.bullish = up;
      s.color = color;
      out.candles.push_back(s);
    } else {
      out.line.push_back(Point{x, out.bounds.toPixelY(c.close, pr)});
    }

    VolumeBarShape bar;
    bar.x = x;
    bar.bottomY = out.volumeRect.bottom();
    bar.width = barW;
    bar.height = out.volumeMax > 0.0
        ? static_cast<float>(c.volume / out.volumeMax) * out.volumeRect.h
        : 0.0f;
    bar.color = color.withAlpha(cfg.volumeAlpha);
    out.volumeBars.push_back(bar);
  }

  if (style == ChartStyle::Line) {
    out.lineThickness = cfg.lineThickness;
    out.lineColor = theme.accent;
    out.areaTop = theme.accent.withAlpha(0.35f);
    out.areaBottom = theme.accent.withAlpha(0.02f);
    if (!out.line.empty()) {
      out.hasMarker = true;
      out.marker = out.line.back();
      out.markerRadius = cfg.markerRadius;
    }
  }
  return out;
}

void submitChart(const ChartPrimitives& prims, ChartBatch& batch) {
  batch.drawGrid(prims.priceRect, prims.gridHLines, prims.gridVLines, prims.gridColor);

  if (prims.style == ChartStyle::Candlestick) {
    for (const auto& c : prims.candles) {
      batch.drawCandle(c.x, c.openY, c.highY, c.lowY, c.closeY,
                       c.bodyWidth, c.wickWidth, c.color);
    }
  } else {
    batch.drawGradientArea(prims.line, prims.priceRect.bottom(),
                           prims.areaTop, prims.areaBottom);
    batch.drawPolyline(prims.line, prims.lineThickness, prims.lineColor);
    if (prims.hasMarker) {
      batch.drawMarker(prims.marker.x, prims.marker.y, prims.markerRadius, prims.lineColor);
    }
  }

  for (const auto& v : prims.volumeBars) {
    batch.drawVolumeBar(v.x, v.bottomY, v.height, v.width, v.color);
  }
}

} // namespace pd
