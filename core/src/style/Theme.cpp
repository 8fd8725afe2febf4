#include "pd/style/Theme.hpp"

#include <cstdio>

namespace pd {

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "Light";

  t.background      = Color{0.95f, 0.95f, 0.96f, 1.0f};
  t.panelBackground = Color{1.0f, 1.0f, 1.0f, 1.0f};
  t.border          = Color{0.78f, 0.79f, 0.82f, 1.0f};

  t.foreground      = Color{0.12f, 0.12f, 0.16f, 1.0f};
  t.foregroundMuted = Color{0.45f, 0.45f, 0.50f, 1.0f};
  t.accent          = Color{0.0f, 0.45f, 0.75f, 1.0f};

  t.bullish = Color{0.1f, 0.6f, 0.3f, 1.0f};
  t.bearish = Color{0.85f, 0.15f, 0.15f, 1.0f};

  return t;
}

Theme themeByName(const std::string& name) {
  if (name == "Light") return lightTheme();
  if (name != "Dark" && !name.empty()) {
    std::fprintf(stderr, "Theme: unknown theme '%s', using Dark\n", name.c_str());
  }
  return darkTheme();
}

} // namespace pd
