#pragma once
#include "pd/chart/ChartProjector.hpp"
#include "pd/data/MarketSnapshot.hpp"
#include "pd/layout/PanelBuilder.hpp"
#include "pd/style/Theme.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace pd {

constexpr float kPricePanelHeight = 88.0f;
constexpr float kIndicatorPanelHeight = 64.0f;

// "chart_<index>"
std::string chartTag(std::size_t index);

// One column: price panel (fixed), chart region (grows, tagged
// chartTag(chartIndex)) and indicator panel (fixed).
PanelBuilder buildCoinColumn(const CoinRecord& coin, std::size_t chartIndex,
                             const Theme& theme);

// Header, one equal-width column per coin, footer. Chart regions are
// tagged in the order of `coins`.
PanelBuilder buildDetailsView(const std::vector<CoinRecord>& coins, ChartStyle style,
                              const Theme& theme, int width, int height);

} // namespace pd
