#pragma once
#include "pd/chart/ChartProjector.hpp"
#include "pd/core/Status.hpp"

#include <string>

namespace pd {

struct EngineConfig {
  std::string drmDevice{"/dev/dri/card0"};
  std::string inputDevice;        // empty = scan /dev/input/event*
  std::string fontPath{"/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"};
  float fontPixelHeight{20.0f};
  std::string theme{"Dark"};
  bool emitKeyRepeats{false};
  ChartStyleConfig chart;
};

// Reads the keys present in `json` over the values already in `out`.
// Unknown keys are ignored. On a parse error or a key of the wrong type
// the result is ConfigInvalid and `out` is left as it was.
Status parseEngineConfig(const std::string& json, EngineConfig& out);

std::string serializeEngineConfig(const EngineConfig& cfg);

// ConfigInvalid also when the file cannot be read.
Status loadEngineConfigFile(const std::string& path, EngineConfig& out);

} // namespace pd
