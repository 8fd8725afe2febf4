// D3.2: Chart batch primitives
// Tests:
//   1. Candle: wick and body widths, body spans open..close
//   2. Doji candle body is at least 1 px tall
//   3. Grid spacing at extent / (n + 1)
//   4. Scaled volume bars resolve against the running maximum
//   5. Lines, polyline, gradient and flat filled areas, marker vertex counts
//   6. finish() is idempotent and clears pending bars

#include "pd/render/ChartBatch.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

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

// Bounding box of the quad starting at vertex `first` (6 vertices).
static pd::Rect quadBox(const pd::ColorBatch& b, std::size_t first) {
  float x0 = 1e9f, y0 = 1e9f, x1 = -1e9f, y1 = -1e9f;
  for (std::size_t i = first; i < first + 6; i++) {
    const auto& v = b.vertices()[i];
    x0 = std::min(x0, v.x);
    y0 = std::min(y0, v.y);
    x1 = std::max(x1, v.x);
    y1 = std::max(y1, v.y);
  }
  return pd::Rect{x0, y0, x1 - x0, y1 - y0};
}

int main() {
  const pd::Color green{0, 1, 0, 1};

  // --- Test 1: candle ---
  {
    pd::ChartBatch batch;
    batch.begin();
    // Bearish in pixel space: open above close on screen
    batch.drawCandle(50, 40, 20, 90, 70, 8, 1, green);
    requireTrue(batch.geometry().vertexCount() == 12, "wick + body");

    pd::Rect wick = quadBox(batch.geometry(), 0);
    requireClose(wick.w, 1.0, 1e-6, "wick width");
    requireClose(wick.x, 49.5, 1e-6, "wick centered");
    requireClose(wick.y, 20.0, 1e-6, "wick from high");
    requireClose(wick.h, 70.0, 1e-6, "wick to low");

    pd::Rect body = quadBox(batch.geometry(), 6);
    requireClose(body.w, 8.0, 1e-6, "body width");
    requireClose(body.x, 46.0, 1e-6, "body centered");
    requireClose(body.y, 40.0, 1e-6, "body top");
    requireClose(body.h, 30.0, 1e-6, "body spans open..close");
    batch.finish();
    std::printf("  Test 1 (candle geometry): PASS\n");
  }

  // --- Test 2: doji ---
  {
    pd::ChartBatch batch;
    batch.begin();
    batch.drawCandle(10, 55, 50, 60, 55, 6, 1, green);
    pd::Rect body = quadBox(batch.geometry(), 6);
    requireClose(body.h, 1.0, 1e-6, "minimum body height");
    batch.finish();
    std::printf("  Test 2 (doji body): PASS\n");
  }

  // --- Test 3: grid ---
  {
    pd::ChartBatch batch;
    batch.begin();
    pd::Rect r{0, 0, 700, 500};
    batch.drawGrid(r, 4, 6, green);
    requireTrue(batch.geometry().vertexCount() == (4 + 6) * 6, "10 grid lines");
    for (int i = 0; i < 4; i++) {
      pd::Rect line = quadBox(batch.geometry(), static_cast<std::size_t>(i) * 6);
      requireClose(line.y + line.h * 0.5f, 100.0 * (i + 1), 1e-3, "h line spacing");
      requireClose(line.w, 700.0, 1e-3, "h line spans width");
    }
    for (int i = 0; i < 6; i++) {
      pd::Rect line = quadBox(batch.geometry(), static_cast<std::size_t>(4 + i) * 6);
      requireClose(line.x + line.w * 0.5f, 100.0 * (i + 1), 1e-3, "v line spacing");
    }

    batch.begin();
    batch.drawGrid(r, 0, 0, green);
    requireTrue(batch.geometry().empty(), "no lines requested");
    batch.finish();
    std::printf("  Test 3 (grid): PASS\n");
  }

  // --- Test 4: scaled volume bars ---
  {
    pd::ChartBatch batch;
    batch.begin();
    batch.drawScaledVolumeBar(10, 100, 50.0, 40, 4, green);
    batch.drawScaledVolumeBar(20, 100, 200.0, 40, 4, green);
    batch.drawScaledVolumeBar(30, 100, 100.0, 40, 4, green);
    batch.drawScaledVolumeBar(40, 100, 0.0, 40, 4, green);
    requireClose(batch.volumeMax(), 200.0, 1e-9, "running max");
    requireTrue(batch.geometry().empty(), "bars pending until resolved");

    batch.resolveVolumeBars();
    requireTrue(batch.geometry().vertexCount() == 18, "zero volume bar skipped");
    requireClose(quadBox(batch.geometry(), 0).h, 10.0, 1e-4, "50/200 of 40");
    requireClose(quadBox(batch.geometry(), 6).h, 40.0, 1e-4, "max fills height");
    requireClose(quadBox(batch.geometry(), 12).h, 20.0, 1e-4, "100/200 of 40");
    pd::Rect tallest = quadBox(batch.geometry(), 6);
    requireClose(tallest.bottom(), 100.0, 1e-4, "bars stand on bottomY");
    requireClose(tallest.w, 4.0, 1e-4, "bar width");

    batch.resolveVolumeBars();
    requireTrue(batch.geometry().vertexCount() == 18, "resolve drains the queue");
    batch.finish();
    std::printf("  Test 4 (scaled volume): PASS\n");
  }

  // --- Test 5: lines and fills ---
  {
    pd::ChartBatch batch;
    batch.begin();
    batch.drawLine(0, 0, 10, 0, 2, green);
    requireTrue(batch.geometry().vertexCount() == 6, "segment quad");
    pd::Rect seg = quadBox(batch.geometry(), 0);
    requireClose(seg.h, 2.0, 1e-5, "thickness across the segment");
    batch.drawLine(5, 5, 5, 5, 2, green);
    requireTrue(batch.geometry().vertexCount() == 6, "zero-length segment skipped");

    std::vector<pd::Point> pts = {{0, 10}, {10, 5}, {20, 8}, {30, 2}};
    batch.begin();
    batch.drawPolyline(pts, 2, green);
    requireTrue(batch.geometry().vertexCount() == 3 * 6, "one quad per segment");

    batch.begin();
    batch.drawGradientArea(pts, 20, green, green.withAlpha(0.0f));
    requireTrue(batch.geometry().vertexCount() == 3 * 6, "6 vertices per area segment");
    const auto& v = batch.geometry().vertices();
    requireClose(v[0].a, 1.0, 1e-6, "top alpha on the line");
    requireClose(v[2].y, 20.0, 1e-6, "bottom on the baseline");
    requireClose(v[2].a, 0.0, 1e-6, "bottom alpha on the baseline");

    batch.begin();
    batch.drawFilledArea(pts, 20, green.withAlpha(0.5f));
    requireTrue(batch.geometry().vertexCount() == 3 * 6, "filled area: 6 vertices per segment");
    double areaSum = 0.0;
    const auto& fv = batch.geometry().vertices();
    for (std::size_t t = 0; t + 2 < fv.size(); t += 3) {
      areaSum += 0.5 * std::fabs((fv[t + 1].x - fv[t].x) * (fv[t + 2].y - fv[t].y) -
                                 (fv[t + 2].x - fv[t].x) * (fv[t + 1].y - fv[t].y));
    }
    // Trapezoids under (0,10)-(10,5)-(20,8)-(30,2) down to y = 20
    requireClose(areaSum, 10 * 12.5 + 10 * 13.5 + 10 * 15.0, 1e-3, "area under the polyline");
    for (const auto& av : fv) {
      requireClose(av.a, 0.5, 1e-6, "uniform alpha");
      requireTrue(av.y <= 20.0f, "nothing below the baseline");
    }
    std::vector<pd::Point> single = {{0, 10}};
    batch.drawFilledArea(single, 20, green);
    requireTrue(batch.geometry().vertexCount() == 3 * 6, "single point adds nothing");

    batch.begin();
    batch.drawMarker(50, 50, 3, green);
    requireTrue(batch.geometry().triangleCount() ==
                    static_cast<std::size_t>(pd::ChartBatch::kMarkerSegments),
                "marker fan");
    for (const auto& mv : batch.geometry().vertices()) {
      double d = std::hypot(mv.x - 50.0, mv.y - 50.0);
      requireTrue(d <= 3.0 + 1e-4, "marker within radius");
    }
    batch.finish();
    std::printf("  Test 5 (lines and fills): PASS\n");
  }

  // --- Test 6: finish idempotence ---
  {
    pd::ChartBatch batch;
    requireTrue(!batch.finish(), "finish without begin");
    batch.begin();
    batch.drawScaledVolumeBar(10, 100, 5.0, 40, 4, green);
    requireTrue(batch.finish(), "finish");
    requireTrue(!batch.finish(), "second finish is a no-op");
    requireClose(batch.volumeMax(), 0.0, 1e-12, "max reset");
    batch.begin();
    batch.resolveVolumeBars();
    requireTrue(batch.geometry().empty(), "no stale bars after finish");
    batch.finish();
    std::printf("  Test 6 (finish idempotence): PASS\n");
  }

  std::printf("D3.2 chart batch: ALL PASS\n");
  return 0;
}
