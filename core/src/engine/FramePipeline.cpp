#include "pd/engine/FramePipeline.hpp"
#include "pd/text/FontAtlas.hpp"
#include "pd/views/DetailsView.hpp"
#include "pd/views/OverviewView.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace pd {

std::vector<std::size_t> activeCoins(const FrameInput& in) {
  std::vector<std::size_t> out;
  if (!in.snapshot) return out;
  const std::size_t n = in.snapshot->coins.size();
  for (std::size_t i = 0; i < n && i < in.checked.size(); i++) {
    if (in.checked[i]) out.push_back(i);
  }
  if (out.empty() && in.selectedIndex < n) out.push_back(in.selectedIndex);
  return out;
}

Status FramePipeline::init(const FontAtlas& atlas) {
  if (!atlas.built()) {
    return Status::fail(ErrorCode::FontParseError, "font atlas was never built");
  }
  atlas_ = &atlas;

  Status st = rects_.init();
  if (st.ok) st = text_.init();
  if (st.ok) st = charts_.init();
  if (!st.ok) {
    std::fprintf(stderr, "FramePipeline: %s\n", st.err.message.c_str());
    atlas_ = nullptr;
  }
  return st;
}

void FramePipeline::computeTree(const PanelBuilder& view, int width, int height) {
  if (atlas_) tree_.compute(view, width, height, textMeasureFor(*atlas_));
  else tree_.compute(view, width, height);
}

const LayoutTree& FramePipeline::buildLayout(const FrameInput& in, int width, int height) {
  static const std::vector<CoinRecord> kNoCoins;
  const std::vector<CoinRecord>& coins = in.snapshot ? in.snapshot->coins : kNoCoins;

  if (in.view == View::Details) {
    std::vector<CoinRecord> shown;
    for (std::size_t idx : activeCoins(in)) shown.push_back(coins[idx]);
    computeTree(buildDetailsView(shown, in.chartStyle, theme_, width, height), width, height);
    return tree_;
  }

  computeTree(buildOverviewView(coins, in.selectedIndex, in.checked, in.chartStyle,
                                theme_, width, height, rowScroll_.offset()),
              width, height);
  const LayoutNode* rows = tree_.find(kCoinRowsTag);
  if (!rows) return tree_;

  // The row extents are only known after a pass; lay out again if the
  // cursor row had to be scrolled into view.
  rowScroll_.setExtent(static_cast<float>(rows->contentLength),
                       static_cast<float>(rows->viewportLength));
  rowScroll_.ensureVisible(coinRowOffset(in.selectedIndex), kCoinRowHeight);
  if (static_cast<int>(std::lround(rowScroll_.offset())) != rows->scrolled) {
    computeTree(buildOverviewView(coins, in.selectedIndex, in.checked, in.chartStyle,
                                  theme_, width, height, rowScroll_.offset()),
                width, height);
  }
  return tree_;
}

Stats FramePipeline::drawCharts(const FrameInput& in, int width, int height) {
  Stats s;
  if (in.view != View::Details || !in.snapshot) return s;

  const std::vector<std::size_t> shown = activeCoins(in);
  const auto regions = tree_.findByPrefix(kChartTagPrefix);
  if (regions.empty()) return s;

  charts_.begin();
  for (const LayoutNode* node : regions) {
    // chart_<i> maps to the i-th shown coin
    std::size_t slot = static_cast<std::size_t>(
        std::strtoul(node->tag.c_str() + std::char_traits<char>::length(kChartTagPrefix),
                     nullptr, 10));
    if (slot >= shown.size()) continue;
    std::size_t coin = shown[slot];
    if (coin >= in.snapshot->candles.size()) continue;
    if (node->bounds.w <= 0 || node->bounds.h <= 0) continue;

    ChartPrimitives prims = projectChart(in.snapshot->candles[coin], node->bounds.toRect(),
                                         in.chartStyle, in.scrollOffset, theme_, chart_);
    submitChart(prims, charts_.batch());
  }
  s += charts_.end(width, height);
  return s;
}

Stats FramePipeline::renderFrame(const FrameInput& in, int width, int height) {
  auto t0 = std::chrono::steady_clock::now();
  Stats s;
  if (!atlas_) return s;

  buildLayout(in, width, height);
  layoutRenderer_.setFocused(in.focusedPanel);

  glViewport(0, 0, width, height);
  glClearColor(theme_.background.r, theme_.background.g, theme_.background.b, 1.0f);
  glClear(GL_COLOR_BUFFER_BIT);
  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  s += layoutRenderer_.render(tree_, *atlas_, rects_, text_, width, height);
  s += drawCharts(in, width, height);

  auto t1 = std::chrono::steady_clock::now();
  s.frameMs = std::chrono::duration<double, std::milli>(t1 - t0).count();
  return s;
}

} // namespace pd
