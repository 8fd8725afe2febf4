#pragma once
#include "pd/chart/ChartProjector.hpp"
#include "pd/layout/PanelBuilder.hpp"
#include "pd/style/Theme.hpp"

#include <cstdint>
#include <string>

namespace pd {

enum class View : std::uint8_t { Overview, Details };

const char* viewName(View v);

// Tag prefix of the regions the chart projector draws into.
constexpr const char* kChartTagPrefix = "chart_";

constexpr float kHeaderHeight = 32.0f;
constexpr float kFooterHeight = 28.0f;

// Title on the left, view and chart style on the right.
PanelBuilder buildStatusHeader(View view, ChartStyle style, const Theme& theme);

// Single line of key hints.
PanelBuilder buildFooter(const std::string& hints, const Theme& theme);

// Bordered panel with a small muted title above `body`.
PanelBuilder titledPanel(const std::string& title, const Theme& theme, PanelBuilder body);

} // namespace pd
