#pragma once
#include "pd/layout/Style.hpp"

#include <string>
#include <vector>

namespace pd {

// Plain descriptor tree; the input of LayoutTree::compute().
struct PanelDesc {
  PanelStyle style;
  std::string tag;        // empty = untagged
  bool hasText{false};
  TextContent text;
  std::vector<PanelDesc> children;
};

// Fluent construction of a PanelDesc:
//
//   auto view = panel().column().gap(8)
//       .child(panel().height(px(40)).background(theme.panelBackground))
//       .child(panel().flexGrow(1).tag("chart_0"));
class PanelBuilder {
public:
  PanelBuilder() = default;

  PanelBuilder& width(Dimension d)  { desc_.style.width = d; return *this; }
  PanelBuilder& height(Dimension d) { desc_.style.height = d; return *this; }
  PanelBuilder& size(Dimension w, Dimension h);
  PanelBuilder& flexGrow(float weight);

  PanelBuilder& direction(FlexDirection d) { desc_.style.direction = d; return *this; }
  PanelBuilder& row()    { return direction(FlexDirection::Row); }
  PanelBuilder& column() { return direction(FlexDirection::Column); }
  PanelBuilder& gap(float g);

  PanelBuilder& padding(float all);
  PanelBuilder& padding(float top, float right, float bottom, float left);

  PanelBuilder& background(const Color& c);
  PanelBuilder& border(float width, const Color& c,
                       BorderStyle style = BorderStyle::Solid);
  PanelBuilder& clip(bool on = true) { desc_.style.clip = on; return *this; }
  PanelBuilder& scrollable(float offset);

  PanelBuilder& focusable(std::string id) { desc_.style.focusId = std::move(id); return *this; }
  PanelBuilder& focusBorder(const Color& c) { desc_.style.focusBorder = c; return *this; }

  PanelBuilder& tag(std::string t) { desc_.tag = std::move(t); return *this; }

  PanelBuilder& text(std::string str, const Color& color, float scale = 1.0f);
  PanelBuilder& textAlign(HAlign h, VAlign v);

  PanelBuilder& child(PanelBuilder c);
  PanelBuilder& children(std::vector<PanelBuilder> cs);

  const PanelDesc& desc() const { return desc_; }
  PanelDesc build() const { return desc_; }

private:
  PanelDesc desc_;
};

inline PanelBuilder panel() { return PanelBuilder{}; }

} // namespace pd
