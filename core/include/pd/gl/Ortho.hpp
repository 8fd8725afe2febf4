#pragma once

namespace pd {

// Column-major orthographic projection mapping pixel space (origin
// top-left, y down) of a width x height surface to clip space.
inline void orthoTopLeft(float width, float height, float out[16]) {
  for (int i = 0; i < 16; i++) out[i] = 0.0f;
  out[0]  = 2.0f / width;
  out[5]  = -2.0f / height;
  out[10] = -1.0f;
  out[12] = -1.0f;
  out[13] = 1.0f;
  out[15] = 1.0f;
}

} // namespace pd
