#pragma once
#include "pd/render/ChartBatch.hpp"
#include "pd/render/ColorPipeline.hpp"

namespace pd {

// GL front of ChartBatch; draw calls go straight to batch().
class ChartRenderer {
public:
  Status init() { return pipeline_.init("charts"); }

  void begin() { batch_.begin(); }
  Stats end(int width, int height);

  ChartBatch& batch() { return batch_; }

private:
  ChartBatch batch_;
  ColorPipeline pipeline_;
};

} // namespace pd
