// Dashboard demo
// Full-screen on a KMS device: fake market feed, overview table and
// per-coin details charts, keyboard driven.
// Usage: dashboard_demo [--config engine.json] [--frames N]

#include "pd/config/EngineConfig.hpp"
#include "pd/data/FakeMarketFeed.hpp"
#include "pd/engine/FramePipeline.hpp"
#include "pd/gl/DrmSurface.hpp"
#include "pd/input/KeyboardInput.hpp"
#include "pd/layout/FocusRing.hpp"
#include "pd/text/FontAtlas.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

static void fatal(const pd::Status& st, const char* ctx) {
  std::fprintf(stderr, "FATAL [%s]: %s: %s\n", ctx, pd::toString(st.err.code),
               st.err.message.c_str());
}

struct AppState {
  pd::FrameInput frame;
  pd::FocusRing focus;
  bool quit{false};
};

static void handleKey(const pd::KeyEvent& ev, AppState& app, std::size_t coinCount,
                      long scrollStep) {
  pd::FrameInput& f = app.frame;
  if (ev.isChar('q')) { app.quit = true; return; }
  if (ev.isChar('c')) {
    f.chartStyle = f.chartStyle == pd::ChartStyle::Candlestick ? pd::ChartStyle::Line
                                                                : pd::ChartStyle::Candlestick;
    return;
  }

  if (f.view == pd::View::Overview) {
    switch (ev.key) {
      case pd::Key::Escape: app.quit = true; break;
      case pd::Key::Up:
      case pd::Key::ShiftTab:
        if (f.selectedIndex > 0) f.selectedIndex--;
        break;
      case pd::Key::Down:
      case pd::Key::Tab:
        if (f.selectedIndex + 1 < coinCount) f.selectedIndex++;
        break;
      case pd::Key::Space:
        if (f.checked.size() < coinCount) f.checked.resize(coinCount, false);
        if (f.selectedIndex < coinCount) f.checked[f.selectedIndex] = !f.checked[f.selectedIndex];
        break;
      case pd::Key::Enter:
        f.view = pd::View::Details;
        f.scrollOffset = 0;
        break;
      default: break;
    }
    return;
  }

  switch (ev.key) {
    case pd::Key::Escape: f.view = pd::View::Overview; break;
    case pd::Key::Left:   f.scrollOffset += scrollStep; break;
    case pd::Key::Right:  f.scrollOffset -= scrollStep; break;
    case pd::Key::PageUp: f.scrollOffset += scrollStep * 4; break;
    case pd::Key::PageDown: f.scrollOffset -= scrollStep * 4; break;
    case pd::Key::Home:   f.scrollOffset = 0; break;
    case pd::Key::Tab:      app.focus.next(); break;
    case pd::Key::ShiftTab: app.focus.previous(); break;
    case pd::Key::Char:
      if (ev.ch == 'h') f.scrollOffset += scrollStep;
      if (ev.ch == 'l') f.scrollOffset -= scrollStep;
      break;
    default: break;
  }
  if (f.scrollOffset < 0) f.scrollOffset = 0;
  f.focusedPanel = app.focus.current();
}

int main(int argc, char* argv[]) {
  std::string configPath;
  long maxFrames = -1;
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) configPath = argv[++i];
    else if (arg == "--frames" && i + 1 < argc) maxFrames = std::atol(argv[++i]);
  }

  pd::EngineConfig config;
  if (!configPath.empty()) {
    pd::Status st = pd::loadEngineConfigFile(configPath, config);
    if (!st.ok) { fatal(st, "config"); return 1; }
  }
  pd::Theme theme = pd::themeByName(config.theme);

  pd::DrmSurfaceConfig surfCfg;
  surfCfg.devicePath = config.drmDevice;
  auto surface = std::make_unique<pd::DrmSurface>(surfCfg);
  pd::Status st = surface->open();
  if (!st.ok) { fatal(st, "surface"); return 1; }
  std::printf("Display %dx%d @ %uHz\n", surface->width(), surface->height(),
              surface->refreshHz());

  pd::FontAtlas atlas;
  st = atlas.buildFromFile(config.fontPath, config.fontPixelHeight);
  if (!st.ok) { fatal(st, "font"); return 1; }

  pd::FramePipeline pipeline(theme, config.chart);
  st = pipeline.init(atlas);
  if (!st.ok) { fatal(st, "render"); return 1; }

  pd::KeyboardInput keyboard(config.emitKeyRepeats);
  bool haveKeys = config.inputDevice.empty() ? keyboard.openFirstKeyboard()
                                             : keyboard.open(config.inputDevice);
  if (!haveKeys) std::fprintf(stderr, "Demo: no keyboard, running without input\n");

  pd::FakeMarketFeedConfig feedCfg;
  feedCfg.coins = {{"BTC", 67000.0}, {"ETH", 3400.0}, {"SOL", 150.0},
                   {"XRP", 0.52}, {"DOGE", 0.12}, {"ADA", 0.45}};
  pd::FakeMarketFeed feed(feedCfg);
  feed.start();

  AppState app;
  pd::MarketSnapshot snapshot;
  app.frame.snapshot = &snapshot;
  const long scrollStep = 10;

  long frames = 0;
  while (!app.quit && (maxFrames < 0 || frames < maxFrames)) {
    for (const pd::KeyEvent& ev : keyboard.pollEvents()) {
      handleKey(ev, app, snapshot.coins.size(), scrollStep);
    }

    // Keep the previous snapshot when nothing new arrived.
    feed.poll(snapshot);

    pd::Stats stats = pipeline.renderFrame(app.frame, surface->width(), surface->height());
    // Focus follows the panels of the view just drawn.
    app.focus.setOrder(pipeline.layout().focusOrder());
    app.frame.focusedPanel = app.focus.current();
    st = surface->present();
    if (!st.ok) { fatal(st, "present"); break; }

    frames++;
    if (frames % 300 == 0) {
      std::printf("frame %ld: %.2f ms, %u draws, %u tris\n", frames, stats.frameMs,
                  stats.drawCalls, stats.triangles);
    }
  }

  feed.stop();
  surface->close();
  return st.ok ? 0 : 1;
}
