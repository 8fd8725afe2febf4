#pragma once
#include "pd/render/ColorBatch.hpp"

#include <vector>

namespace pd {

// Chart geometry in pixel space. Callers resolve data-to-pixel mapping
// (see ChartProjector); nothing here knows about prices.
class ChartBatch {
public:
  void begin();
  bool finish();
  bool active() const { return geom_.active(); }

  void drawRect(const Rect& r, const Color& c) { geom_.addRect(r, c); }

  void drawLineH(float x1, float x2, float y, float thickness, const Color& c);
  void drawLineV(float x, float y1, float y2, float thickness, const Color& c);

  // Arbitrary segment as a quad extruded along its perpendicular.
  // Zero-length segments emit nothing.
  void drawLine(float x1, float y1, float x2, float y2, float thickness, const Color& c);

  void drawDashedLineH(float x1, float x2, float y, float thickness,
                       float dash, float gap, const Color& c);
  void drawDashedLineV(float x, float y1, float y2, float thickness,
                       float dash, float gap, const Color& c);

  // hLines / vLines interior lines, evenly spaced at extent / (n + 1).
  void drawGrid(const Rect& r, int hLines, int vLines, const Color& c,
                float thickness = 1.0f);

  void drawPolyline(const std::vector<Point>& pts, float thickness, const Color& c);

  // Area between the polyline and a horizontal baseline.
  void drawFilledArea(const std::vector<Point>& pts, float baselineY, const Color& c);
  void drawGradientArea(const std::vector<Point>& pts, float baselineY,
                        const Color& top, const Color& bottom);

  // Filled disc as an 8-segment triangle fan.
  void drawMarker(float cx, float cy, float radius, const Color& c);

  // Wick spans highY..lowY at wickWidth; body spans openY..closeY at
  // bodyWidth and is at least 1 px tall.
  void drawCandle(float x, float openY, float highY, float lowY, float closeY,
                  float bodyWidth, float wickWidth, const Color& c);

  // Bar of `height` pixels standing on `bottomY`, centered at x.
  void drawVolumeBar(float x, float bottomY, float height, float width, const Color& c);

  // Bar scaled against the largest volume queued into this batch so far.
  // Heights are resolved by resolveVolumeBars(), which the renderer calls
  // before upload.
  void drawScaledVolumeBar(float x, float bottomY, double volume, float maxHeight,
                           float width, const Color& c);
  void resolveVolumeBars();
  double volumeMax() const { return volumeMax_; }

  const ColorBatch& geometry() const { return geom_; }

  static constexpr int kMarkerSegments = 8;

private:
  struct PendingBar {
    float x, bottomY;
    double volume;
    float maxHeight, width;
    Color color;
  };

  ColorBatch geom_;
  std::vector<PendingBar> pendingBars_;
  double volumeMax_{0.0};
};

} // namespace pd
