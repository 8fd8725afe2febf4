#include "pd/render/RectRenderer.hpp"

namespace pd {

Stats RectRenderer::end(int width, int height) {
  Stats s;
  if (!batch_.active()) return s;
  s = pipeline_.draw(batch_.geometry(), width, height);
  batch_.finish();
  return s;
}

} // namespace pd
