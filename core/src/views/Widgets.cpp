#include "pd/views/Widgets.hpp"

namespace pd {

const char* viewName(View v) {
  switch (v) {
    case View::Overview: return "OVERVIEW";
    case View::Details:  return "DETAILS";
  }
  return "?";
}

PanelBuilder buildStatusHeader(View view, ChartStyle style, const Theme& theme) {
  std::string right = viewName(view);
  right += style == ChartStyle::Candlestick ? "  Candles" : "  Line";

  return panel()
      .height(px(kHeaderHeight))
      .row()
      .padding(0.0f, theme.panelPadding, 0.0f, theme.panelPadding)
      .background(theme.panelBackground)
      .border(theme.borderWidth, theme.border)
      .child(panel()
                 .flexGrow(1)
                 .text("PanelDeck", theme.accent, theme.textScale)
                 .textAlign(HAlign::Left, VAlign::Center))
      .child(panel()
                 .flexGrow(1)
                 .text(right, theme.foregroundMuted, theme.textScaleSmall)
                 .textAlign(HAlign::Right, VAlign::Center));
}

PanelBuilder buildFooter(const std::string& hints, const Theme& theme) {
  return panel()
      .height(px(kFooterHeight))
      .padding(0.0f, theme.panelPadding, 0.0f, theme.panelPadding)
      .background(theme.panelBackground)
      .text(hints, theme.foregroundMuted, theme.textScaleSmall)
      .textAlign(HAlign::Left, VAlign::Center);
}

PanelBuilder titledPanel(const std::string& title, const Theme& theme, PanelBuilder body) {
  return panel()
      .column()
      .padding(theme.panelPadding * 0.5f)
      .background(theme.panelBackground)
      .border(theme.borderWidth, theme.border)
      .child(panel()
                 .text(title, theme.foregroundMuted, theme.textScaleSmall)
                 .textAlign(HAlign::Left, VAlign::Top))
      .child(body.flexGrow(1));
}

} // namespace pd
