#pragma once
#include "pd/style/Color.hpp"

#include <string>

namespace pd {

struct Theme {
  std::string name;

  // Surfaces
  Color background{0.04f, 0.04f, 0.06f, 1.0f};
  Color panelBackground{0.08f, 0.08f, 0.10f, 1.0f};
  Color border{0.25f, 0.28f, 0.32f, 1.0f};

  // Text
  Color foreground{1.0f, 1.0f, 1.0f, 1.0f};
  Color foregroundMuted{0.5f, 0.5f, 0.5f, 1.0f};
  Color accent{0.0f, 1.0f, 1.0f, 1.0f};

  // Candle / change colors (#0ECB81, #F6465D)
  Color bullish{0.055f, 0.796f, 0.506f, 1.0f};
  Color bearish{0.965f, 0.275f, 0.365f, 1.0f};

  // Spacing in pixels
  float panelGap{8.0f};
  float panelPadding{8.0f};
  float borderWidth{1.0f};

  // Text scale relative to the atlas pixel height
  float textScale{1.0f};
  float textScaleSmall{0.8f};
  float textScaleBig{1.2f};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// Preset by name ("Dark" / "Light", case-sensitive). Unknown names fall
// back to the dark preset.
Theme themeByName(const std::string& name);

} // namespace pd
