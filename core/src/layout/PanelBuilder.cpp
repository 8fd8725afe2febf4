#include "pd/layout/PanelBuilder.hpp"

#include <algorithm>

namespace pd {

PanelBuilder& PanelBuilder::size(Dimension w, Dimension h) {
  desc_.style.width = w;
  desc_.style.height = h;
  return *this;
}

PanelBuilder& PanelBuilder::flexGrow(float weight) {
  desc_.style.flexGrow = std::max(0.0f, weight);
  return *this;
}

PanelBuilder& PanelBuilder::gap(float g) {
  desc_.style.gap = std::max(0.0f, g);
  return *this;
}

PanelBuilder& PanelBuilder::padding(float all) {
  return padding(all, all, all, all);
}

PanelBuilder& PanelBuilder::padding(float top, float right, float bottom, float left) {
  desc_.style.padding = Edges{std::max(0.0f, top), std::max(0.0f, right),
                              std::max(0.0f, bottom), std::max(0.0f, left)};
  return *this;
}

PanelBuilder& PanelBuilder::background(const Color& c) {
  desc_.style.hasBackground = true;
  desc_.style.background = c;
  return *this;
}

PanelBuilder& PanelBuilder::border(float width, const Color& c, BorderStyle style) {
  desc_.style.border.style = width > 0.0f ? style : BorderStyle::None;
  desc_.style.border.width = std::max(0.0f, width);
  desc_.style.border.color = c;
  return *this;
}

PanelBuilder& PanelBuilder::scrollable(float offset) {
  desc_.style.scrollable = true;
  desc_.style.scrollOffset = std::max(0.0f, offset);
  desc_.style.clip = true;
  return *this;
}

PanelBuilder& PanelBuilder::text(std::string str, const Color& color, float scale) {
  desc_.hasText = true;
  desc_.text.text = std::move(str);
  desc_.text.color = color;
  desc_.text.scale = scale;
  return *this;
}

PanelBuilder& PanelBuilder::textAlign(HAlign h, VAlign v) {
  desc_.text.hAlign = h;
  desc_.text.vAlign = v;
  return *this;
}

PanelBuilder& PanelBuilder::child(PanelBuilder c) {
  desc_.children.push_back(std::move(c.desc_));
  return *this;
}

PanelBuilder& PanelBuilder::children(std::vector<PanelBuilder> cs) {
  desc_.children.reserve(desc_.children.size() + cs.size());
  for (auto& c : cs) desc_.children.push_back(std::move(c.desc_));
  return *this;
}

} // namespace pd
