#pragma once
#include "pd/style/Color.hpp"
#include "pd/text/TextAlign.hpp"

#include <cstdint>
#include <string>

namespace pd {

enum class SizeMode : std::uint8_t {
  Auto,     // content size along the main axis, stretch along the cross axis
  Fixed,    // value in pixels
  Percent   // value in [0..100] of the parent's inner size
};

struct Dimension {
  SizeMode mode{SizeMode::Auto};
  float value{0};
};

inline Dimension autoSize() { return Dimension{SizeMode::Auto, 0.0f}; }
inline Dimension px(float v) { return Dimension{SizeMode::Fixed, v}; }
inline Dimension percent(float v) { return Dimension{SizeMode::Percent, v}; }

enum class FlexDirection : std::uint8_t { Row, Column };

enum class BorderStyle : std::uint8_t { None, Solid, Dashed, Dotted };

struct Border {
  BorderStyle style{BorderStyle::None};
  float width{0};
  Color color{};
};

struct Edges {
  float top{0}, right{0}, bottom{0}, left{0};
};

struct TextContent {
  std::string text;
  Color color{1.0f, 1.0f, 1.0f, 1.0f};
  float scale{1.0f};
  HAlign hAlign{HAlign::Left};
  VAlign vAlign{VAlign::Center};
};

struct PanelStyle {
  Dimension width;
  Dimension height;
  float flexGrow{0};      // share of leftover main-axis space; 0 = none
  FlexDirection direction{FlexDirection::Row};
  float gap{0};
  Edges padding;

  bool hasBackground{false};
  Color background{};
  Border border;
  bool clip{false};       // scissor children to this node

  // Children overflow along the main axis and are shifted back by
  // scrollOffset pixels. Implies clip.
  bool scrollable{false};
  float scrollOffset{0};

  std::string focusId;    // non-empty = takes part in focus navigation
  Color focusBorder{1.0f, 0.8f, 0.2f, 1.0f};
};

} // namespace pd
