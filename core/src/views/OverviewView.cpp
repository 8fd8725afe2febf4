#include "pd/views/OverviewView.hpp"
#include "pd/views/Format.hpp"
#include "pd/views/Widgets.hpp"

#include <string>
#include <utility>

namespace pd {

namespace {

// Column shares of the table width, in percent. The last column takes
// whatever is left.
constexpr float kColMark = 10.0f;
constexpr float kColPair = 18.0f;
constexpr float kColPrice = 24.0f;
constexpr float kColChange = 16.0f;
constexpr float kColVolume = 14.0f;

PanelBuilder cell(float pct, const std::string& s, const Color& c, float scale) {
  PanelBuilder b = panel().text(s, c, scale).textAlign(HAlign::Left, VAlign::Center);
  if (pct > 0.0f) b.width(percent(pct));
  else b.flexGrow(1);
  return b;
}

PanelBuilder tableRow(const Theme& theme) {
  return panel()
      .height(px(kCoinRowHeight))
      .row()
      .padding(0.0f, theme.panelPadding, 0.0f, theme.panelPadding);
}

PanelBuilder buildHeaderRow(const Theme& theme) {
  const Color& c = theme.accent;
  const float s = theme.textScaleSmall;
  return tableRow(theme)
      .child(cell(kColMark, "", c, s))
      .child(cell(kColPair, "PAIR", c, s))
      .child(cell(kColPrice, "PRICE", c, s))
      .child(cell(kColChange, "24h %", c, s))
      .child(cell(kColVolume, "24h VOL", c, s))
      .child(cell(0.0f, "24h H/L", c, s));
}

} // namespace

PanelBuilder buildCoinRow(const CoinRecord& coin, bool selected, bool checked,
                          const Theme& theme) {
  std::string mark = selected ? ">" : " ";
  mark += checked ? "[x]" : "[ ]";

  const Color changeColor = coin.change24h >= 0.0 ? theme.bullish : theme.bearish;
  const float s = theme.textScale;

  PanelBuilder row = tableRow(theme);
  if (selected) row.background(theme.accent.withAlpha(0.18f));
  row.child(cell(kColMark, mark, theme.foreground, s))
      .child(cell(kColPair, coin.symbol + "/USD", theme.foreground, s))
      .child(cell(kColPrice, formatPrice(coin.price), theme.foreground, s))
      .child(cell(kColChange, formatChange(coin.change24h), changeColor, s))
      .child(cell(kColVolume, formatVolume(coin.volume24h), theme.foregroundMuted, s))
      .child(cell(0.0f,
                  formatPriceShort(coin.high24h) + " / " + formatPriceShort(coin.low24h),
                  theme.foregroundMuted, s));
  return row;
}

PanelBuilder buildOverviewView(const std::vector<CoinRecord>& coins,
                               std::size_t selectedIndex,
                               const std::vector<bool>& checked, ChartStyle style,
                               const Theme& theme, int width, int height,
                               float rowScroll) {
  PanelBuilder rows = panel().column().flexGrow(1).scrollable(rowScroll).tag(kCoinRowsTag);
  for (std::size_t i = 0; i < coins.size(); i++) {
    bool isChecked = i < checked.size() && checked[i];
    PanelBuilder row = buildCoinRow(coins[i], i == selectedIndex, isChecked, theme);
    row.tag("row_" + std::to_string(i));
    rows.child(std::move(row));
  }
  PanelBuilder table = panel().column().clip()
      .child(buildHeaderRow(theme))
      .child(std::move(rows));

  PanelBuilder body = titledPanel("Coins", theme, std::move(table));
  body.flexGrow(1).focusable(kCoinTableFocus).focusBorder(theme.accent);

  return panel()
      .size(px(static_cast<float>(width)), px(static_cast<float>(height)))
      .column()
      .gap(theme.panelGap)
      .padding(theme.panelPadding)
      .background(theme.background)
      .child(buildStatusHeader(View::Overview, style, theme))
      .child(std::move(body))
      .child(buildFooter("Up/Down move  Space check  Enter details  c style  q quit", theme));
}

} // namespace pd
