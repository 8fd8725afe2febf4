#pragma once
#include <cstdint>

namespace pd {

struct Stats {
  // Timing
  double frameMs = 0.0;

  // Rendering
  std::uint32_t drawCalls = 0;
  std::uint32_t triangles = 0;

  // Upload activity
  std::uint64_t uploadedBytesThisFrame = 0;

  Stats& operator+=(const Stats& o) {
    drawCalls += o.drawCalls;
    triangles += o.triangles;
    uploadedBytesThisFrame += o.uploadedBytesThisFrame;
    return *this;
  }
};

} // namespace pd
