#pragma once
#include "pd/gl/ScanoutChain.hpp"
#include "pd/gl/Surface.hpp"

#include <glad/gles2.h>   // GLAD must precede any system GL header
#include <EGL/egl.h>
#include <gbm.h>
#include <xf86drmMode.h>

#include <cstdint>
#include <string>
#include <vector>

namespace pd {

struct DrmSurfaceConfig {
  std::string devicePath{"/dev/dri/card0"};
  int flipTimeoutMs{1000};
};

// KMS scanout through a GBM surface with an EGL / GLES2 context.
//
// open() takes DRM master on the device, picks the first connected
// connector and its preferred mode, then builds gbm device -> gbm surface
// -> EGL display -> context -> window surface. close() tears the same
// chain down in reverse and restores the CRTC found at open.
class DrmSurface : public Surface {
public:
  explicit DrmSurface(DrmSurfaceConfig config = DrmSurfaceConfig{});
  ~DrmSurface() override;

  DrmSurface(const DrmSurface&) = delete;
  DrmSurface& operator=(const DrmSurface&) = delete;

  Status open() override;
  Status present() override;
  void close();

  int width() const override { return width_; }
  int height() const override { return height_; }

  bool isOpen() const { return eglSurface_ != EGL_NO_SURFACE; }
  std::uint64_t framesPresented() const { return frames_; }
  std::uint32_t refreshHz() const { return mode_.vrefresh; }

  // RGBA8 copy of the back buffer, bottom-left origin. Empty when closed.
  std::vector<std::uint8_t> readPixels() const;

private:
  Status openDevice();
  Status pickMode();
  Status createGbm();
  Status createEgl();

  bool framebufferFor(gbm_bo* bo, std::uint32_t& fbId);
  bool waitForFlip();

  static void onPageFlip(int fd, unsigned int frame, unsigned int sec,
                         unsigned int usec, void* userData);

  DrmSurfaceConfig config_;

  int fd_{-1};
  std::uint32_t connectorId_{0};
  std::uint32_t crtcId_{0};
  drmModeModeInfo mode_{};
  drmModeCrtc* savedCrtc_{nullptr};

  gbm_device* gbm_{nullptr};
  gbm_surface* gbmSurface_{nullptr};
  ScanoutChain<gbm_bo> scanout_;

  EGLDisplay display_{EGL_NO_DISPLAY};
  EGLConfig eglConfig_{nullptr};
  EGLContext context_{EGL_NO_CONTEXT};
  EGLSurface eglSurface_{EGL_NO_SURFACE};

  bool modeSet_{false};
  bool flipPending_{false};
  int width_{0};
  int height_{0};
  std::uint64_t frames_{0};
};

} // namespace pd
