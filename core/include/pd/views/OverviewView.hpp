#pragma once
#include "pd/chart/ChartProjector.hpp"
#include "pd/data/MarketSnapshot.hpp"
#include "pd/layout/PanelBuilder.hpp"
#include "pd/style/Theme.hpp"

#include <cstddef>
#include <vector>

namespace pd {

constexpr float kCoinRowHeight = 28.0f;

// Scrollable column holding the coin rows; the header row stays put.
constexpr const char* kCoinRowsTag = "coin_rows";
constexpr const char* kCoinTableFocus = "coins";

// One table row. The cursor row is highlighted; checked rows are the
// ones the details view will show.
PanelBuilder buildCoinRow(const CoinRecord& coin, bool selected, bool checked,
                          const Theme& theme);

// Top edge of a row inside the kCoinRowsTag column, before scrolling.
inline float coinRowOffset(std::size_t index) {
  return static_cast<float>(index) * kCoinRowHeight;
}

// Header, coin table, footer. Rows are tagged "row_<index>" and scrolled
// up by rowScroll pixels.
PanelBuilder buildOverviewView(const std::vector<CoinRecord>& coins,
                               std::size_t selectedIndex,
                               const std::vector<bool>& checked, ChartStyle style,
                               const Theme& theme, int width, int height,
                               float rowScroll = 0.0f);

} // namespace pd
