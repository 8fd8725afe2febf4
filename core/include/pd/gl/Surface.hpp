#pragma once
#include "pd/core/Status.hpp"

namespace pd {

struct SurfaceSize {
  int width{0};
  int height{0};
};

// Presentable display target that owns the rendering context. One owner
// for the process lifetime; the render loop borrows it by reference.
class Surface {
public:
  virtual ~Surface() = default;

  // Acquire the device, pick a mode, allocate buffers, create the context.
  virtual Status open() = 0;

  // Swap synchronized to vertical blank. Blocks until the flip completes.
  virtual Status present() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;
  SurfaceSize size() const { return SurfaceSize{width(), height()}; }
};

} // namespace pd
