#include "pd/render/ChartBatch.hpp"

#include <algorithm>
#include <cmath>

namespace pd {

void ChartBatch::begin() {
  geom_.begin();
  pendingBars_.clear();
  volumeMax_ = 0.0;
}

bool ChartBatch::finish() {
  pendingBars_.clear();
  volumeMax_ = 0.0;
  return geom_.finish();
}

void ChartBatch::drawLineH(float x1, float x2, float y, float thickness, const Color& c) {
  float x0 = std::min(x1, x2);
  geom_.addRect(Rect{x0, y - thickness * 0.5f, std::fabs(x2 - x1), thickness}, c);
}

void ChartBatch::drawLineV(float x, float y1, float y2, float thickness, const Color& c) {
  float y0 = std::min(y1, y2);
  geom_.addRect(Rect{x - thickness * 0.5f, y0, thickness, std::fabs(y2 - y1)}, c);
}

void ChartBatch::drawLine(float x1, float y1, float x2, float y2, float thickness,
                          const Color& c) {
  float dx = x2 - x1;
  float dy = y2 - y1;
  float len = std::sqrt(dx * dx + dy * dy);
  if (len < 1e-6f) return;

  float half = thickness * 0.5f;
  float nx = -dy / len * half;
  float ny = dx / len * half;
  geom_.addQuad(Point{x1 + nx, y1 + ny}, Point{x2 + nx, y2 + ny},
                Point{x2 - nx, y2 - ny}, Point{x1 - nx, y1 - ny}, c);
}

void ChartBatch::drawDashedLineH(float x1, float x2, float y, float thickness,
                                 float dash, float gap, const Color& c) {
  if (dash <= 0.0f) return;
  float start = std::min(x1, x2);
  float end = std::max(x1, x2);
  for (float pos = start; pos < end; pos += dash + gap) {
    drawLineH(pos, std::min(pos + dash, end), y, thickness, c);
  }
}

void ChartBatch::drawDashedLineV(float x, float y1, float y2, float thickness,
                                 float dash, float gap, const Color& c) {
  if (dash <= 0.0f) return;
  float start = std::min(y1, y2);
  float end = std::max(y1, y2);
  for (float pos = start; pos < end; pos += dash + gap) {
    drawLineV(x, pos, std::min(pos + dash, end), thickness, c);
  }
}

void ChartBatch::drawGrid(const Rect& r, int hLines, int vLines, const Color& c,
                          float thickness) {
  if (hLines > 0) {
    float step = r.h / static_cast<float>(hLines + 1);
    for (int i = 1; i <= hLines; i++) {
      drawLineH(r.x, r.right(), r.y + step * static_cast<float>(i), thickness, c);
    }
  }
  if (vLines > 0) {
    float step = r.w / static_cast<float>(vLines + 1);
    for (int i = 1; i <= vLines; i++) {
      drawLineV(r.x + step * static_cast<float>(i), r.y, r.bottom(), thickness, c);
    }
  }
}

void ChartBatch::drawPolyline(const std::vector<Point>& pts, float thickness,
                              const Color& c) {
  for (std::size_t i = 1; i < pts.size(); i++) {
    drawLine(pts[i - 1].x, pts[i - 1].y, pts[i].x, pts[i].y, thickness, c);
  }
}

void ChartBatch::drawFilledArea(const std::vector<Point>& pts, float baselineY,
                                const Color& c) {
  drawGradientArea(pts, baselineY, c, c);
}

void ChartBatch::drawGradientArea(const std::vector<Point>& pts, float baselineY,
                                  const Color& top, const Color& bottom) {
  for (std::size_t i = 1; i < pts.size(); i++) {
    const Point& a = pts[i - 1];
    const Point& b = pts[i];
    geom_.addVertex(a.x, a.y, top);
    geom_.addVertex(b.x, b.y, top);
    geom_.addVertex(b.x, baselineY, bottom);
    geom_.addVertex(a.x, a.y, top);
    geom_.addVertex(b.x, baselineY, bottom);
    geom_.addVertex(a.x, baselineY, bottom);
  }
}

void ChartBatch::drawMarker(float cx, float cy, float radius, const Color& c) {
  constexpr float kTwoPi = 6.28318530718f;
  for (int i = 0; i < kMarkerSegments; i++) {
    float a0 = kTwoPi * static_cast<float>(i) / kMarkerSegments;
    float a1 = kTwoPi * static_cast<float>(i + 1) / kMarkerSegments;
    geom_.addTriangle(Point{cx, cy},
                      Point{cx + radius * std::cos(a0), cy + radius * std::sin(a0)},
                      Point{cx + radius * std::cos(a1), cy + radius * std::sin(a1)}, c);
  }
}

void ChartBatch::drawCandle(float x, float openY, float highY, float lowY, float closeY,
                            float bodyWidth, float wickWidth, const Color& c) {
  float wickTop = std::min(highY, lowY);
  float wickBottom = std::max(highY, lowY);
  geom_.addRect(Rect{x - wickWidth * 0.5f, wickTop, wickWidth, wickBottom - wickTop}, c);

  float bodyTop = std::min(openY, closeY);
  float bodyH = std::max(std::fabs(closeY - openY), 1.0f);
  geom_.addRect(Rect{x - bodyWidth * 0.5f, bodyTop, bodyWidth, bodyH}, c);
}

void ChartBatch::drawVolumeBar(float x, float bottomY, float height, float width,
                               const Color& c) {
  geom_.addRect(Rect{x - width * 0.5f, bottomY - height, width, height}, c);
}

void ChartBatch::drawScaledVolumeBar(float x, float bottomY, double volume, float maxHeight,
                                     float width, const Color& c) {
  volumeMax_ = std::max(volumeMax_, volume);
  pendingBars_.push_back(PendingBar{x, bottomY, volume, maxHeight, width, c});
}

void ChartBatch::resolveVolumeBars() {
  for (const auto& bar : pendingBars_) {
    float h = 0.0f;
    if (volumeMax_ > 0.0 && bar.volume > 0.0) {
      h = static_cast<float>(bar.volume / volumeMax_) * bar.maxHeight;
    }
    drawVolumeBar(bar.x, bar.bottomY, h, bar.width, bar.color);
  }
  pendingBars_.clear();
}

} // namespace pd
