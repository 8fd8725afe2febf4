#include "pd/views/DetailsView.hpp"
#include "pd/views/Format.hpp"
#include "pd/views/Widgets.hpp"

#include <cstdio>
#include <utility>

namespace pd {

std::string chartTag(std::size_t index) {
  return kChartTagPrefix + std::to_string(index);
}

namespace {

Color priceColor(const CoinRecord& coin, const Theme& theme) {
  if (coin.price > coin.prevPrice) return theme.bullish;
  if (coin.price < coin.prevPrice) return theme.bearish;
  return theme.foreground;
}

PanelBuilder textLine(const std::string& s, const Color& c, float scale,
                      HAlign h = HAlign::Left) {
  return panel().text(s, c, scale).textAlign(h, VAlign::Center);
}

PanelBuilder buildPriceBody(const CoinRecord& coin, const Theme& theme) {
  const Color changeColor = coin.change24h >= 0.0 ? theme.bullish : theme.bearish;
  return panel()
      .column()
      .child(textLine(formatPrice(coin.price), priceColor(coin, theme), theme.textScaleBig))
      .child(panel()
                 .row()
                 .child(textLine(formatChange(coin.change24h), changeColor,
                                 theme.textScaleSmall).flexGrow(1))
                 .child(textLine("L:" + formatPriceShort(coin.low24h) +
                                     " H:" + formatPriceShort(coin.high24h),
                                 theme.foregroundMuted, theme.textScaleSmall,
                                 HAlign::Right).flexGrow(1)));
}

PanelBuilder buildIndicatorBody(const CoinRecord& coin, const Theme& theme) {
  double range = coin.high24h - coin.low24h;
  double position = range > 0.0 ? (coin.price - coin.low24h) / range * 100.0 : 50.0;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.0f%% of range", position);

  return panel()
      .column()
      .child(textLine("Vol " + formatVolume(coin.volume24h), theme.foreground,
                      theme.textScaleSmall))
      .child(textLine(buf, theme.foregroundMuted, theme.textScaleSmall));
}

} // namespace

PanelBuilder buildCoinColumn(const CoinRecord& coin, std::size_t chartIndex,
                             const Theme& theme) {
  PanelBuilder price = titledPanel(coin.symbol + "/USD", theme, buildPriceBody(coin, theme));
  price.height(px(kPricePanelHeight));

  PanelBuilder chart = titledPanel("Chart", theme, panel().tag(chartTag(chartIndex)));
  chart.flexGrow(1).focusable(chartTag(chartIndex)).focusBorder(theme.accent);

  PanelBuilder indicators = titledPanel("Indicators", theme, buildIndicatorBody(coin, theme));
  indicators.height(px(kIndicatorPanelHeight));

  // Zero basis so every column gets the same share of the row.
  return panel()
      .width(px(0))
      .flexGrow(1)
      .column()
      .gap(theme.panelGap)
      .child(std::move(price))
      .child(std::move(chart))
      .child(std::move(indicators));
}

PanelBuilder buildDetailsView(const std::vector<CoinRecord>& coins, ChartStyle style,
                              const Theme& theme, int width, int height) {
  std::vector<PanelBuilder> columns;
  columns.reserve(coins.size());
  for (std::size_t i = 0; i < coins.size(); i++) {
    columns.push_back(buildCoinColumn(coins[i], i, theme));
  }

  return panel()
      .size(px(static_cast<float>(width)), px(static_cast<float>(height)))
      .column()
      .gap(theme.panelGap)
      .padding(theme.panelPadding)
      .background(theme.background)
      .child(buildStatusHeader(View::Details, style, theme))
      .child(panel().flexGrow(1).row().gap(theme.panelGap).children(std::move(columns)))
      .child(buildFooter("Esc back  Tab next  c style  h/l scroll  Home latest", theme));
}

} // namespace pd
