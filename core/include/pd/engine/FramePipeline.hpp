#pragma once
#include "pd/chart/ChartProjector.hpp"
#include "pd/data/MarketSnapshot.hpp"
#include "pd/debug/Stats.hpp"
#include "pd/layout/LayoutTree.hpp"
#include "pd/layout/ScrollState.hpp"
#include "pd/render/ChartRenderer.hpp"
#include "pd/render/LayoutRenderer.hpp"
#include "pd/render/RectRenderer.hpp"
#include "pd/style/Theme.hpp"
#include "pd/text/TextRenderer.hpp"
#include "pd/views/OverviewView.hpp"
#include "pd/views/Widgets.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pd {

class FontAtlas;

// Application state the frame is drawn from. Owned by the caller.
struct FrameInput {
  View view{View::Overview};
  const MarketSnapshot* snapshot{nullptr};  // nullptr draws an empty view
  std::size_t selectedIndex{0};
  std::vector<bool> checked;
  ChartStyle chartStyle{ChartStyle::Candlestick};
  long scrollOffset{0};
  std::string focusedPanel;  // focus id drawn with its focus border; "" = none
};

// Coins shown by the details view: the checked ones, or the cursor row
// when nothing is checked. Indices into snapshot->coins.
std::vector<std::size_t> activeCoins(const FrameInput& in);

// One frame: build the view, compute layout, paint panels and text,
// then project a chart into every chart_<i> region.
class FramePipeline {
public:
  FramePipeline(const Theme& theme, const ChartStyleConfig& chart)
      : theme_(theme), chart_(chart) {}

  // Requires a current GL context. The atlas must outlive the pipeline.
  Status init(const FontAtlas& atlas);

  // Layout only; no GL. renderFrame() calls this first. The overview
  // table scrolls just far enough to keep the cursor row in view.
  const LayoutTree& buildLayout(const FrameInput& in, int width, int height);

  Stats renderFrame(const FrameInput& in, int width, int height);

  const LayoutTree& layout() const { return tree_; }
  const ScrollState& rowScroll() const { return rowScroll_; }
  const Theme& theme() const { return theme_; }
  void setTheme(const Theme& theme) { theme_ = theme; }

private:
  void computeTree(const PanelBuilder& view, int width, int height);
  Stats drawCharts(const FrameInput& in, int width, int height);

  Theme theme_;
  ChartStyleConfig chart_;
  const FontAtlas* atlas_{nullptr};

  LayoutTree tree_;
  ScrollState rowScroll_{kCoinRowHeight};
  LayoutRenderer layoutRenderer_;
  RectRenderer rects_;
  TextRenderer text_;
  ChartRenderer charts_;
};

} // namespace pd
