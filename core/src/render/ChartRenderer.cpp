#include "pd/render/ChartRenderer.hpp"

namespace pd {

Stats ChartRenderer::end(int width, int height) {
  Stats s;
  if (!batch_.active()) return s;
  batch_.resolveVolumeBars();
  s = pipeline_.draw(batch_.geometry(), width, height);
  batch_.finish();
  return s;
}

} // namespace pd
