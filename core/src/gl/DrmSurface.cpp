#include "pd/gl/DrmSurface.hpp"

#include <xf86drm.h>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace pd {

namespace {

struct FbRecord {
  int fd;
  std::uint32_t fbId;
};

// gbm destroys buffer objects with the surface; drop the KMS fb with them.
void destroyFbRecord(gbm_bo* /*bo*/, void* data) {
  auto* rec = static_cast<FbRecord*>(data);
  if (rec->fbId) drmModeRmFB(rec->fd, rec->fbId);
  delete rec;
}

std::string errnoText(const char* what) {
  return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

DrmSurface::DrmSurface(DrmSurfaceConfig config) : config_(std::move(config)) {}

DrmSurface::~DrmSurface() {
  close();
}

Status DrmSurface::open() {
  if (isOpen()) return Status::success();

  Status st = openDevice();
  if (st.ok) st = pickMode();
  if (st.ok) st = createGbm();
  if (st.ok) st = createEgl();

  if (!st.ok) {
    std::fprintf(stderr, "DrmSurface: %s (%s)\n", st.err.message.c_str(),
                 toString(st.err.code));
    close();
    return st;
  }

  std::fprintf(stderr, "DrmSurface: %dx%d@%u on %s\n", width_, height_,
               mode_.vrefresh, config_.devicePath.c_str());
  return st;
}

Status DrmSurface::openDevice() {
  fd_ = ::open(config_.devicePath.c_str(), O_RDWR | O_CLOEXEC);
  if (fd_ < 0) {
    return Status::fail(ErrorCode::DeviceUnavailable,
                        errnoText(("open " + config_.devicePath).c_str()));
  }
  if (drmSetMaster(fd_) != 0) {
    return Status::fail(ErrorCode::DeviceUnavailable,
                        config_.devicePath + " is held by another process (" +
                        std::strerror(errno) + ")");
  }
  return Status::success();
}

Status DrmSurface::pickMode() {
  drmModeRes* res = drmModeGetResources(fd_);
  if (!res) {
    return Status::fail(ErrorCode::DeviceUnavailable,
                        errnoText("drmModeGetResources"));
  }

  drmModeConnector* conn = nullptr;
  for (int i = 0; i < res->count_connectors && !conn; i++) {
    drmModeConnector* c = drmModeGetConnector(fd_, res->connectors[i]);
    if (!c) continue;
    if (c->connection == DRM_MODE_CONNECTED && c->count_modes > 0) {
      conn = c;
    } else {
      drmModeFreeConnector(c);
    }
  }
  if (!conn) {
    drmModeFreeResources(res);
    return Status::fail(ErrorCode::DeviceUnavailable, "no connected display");
  }

  mode_ = conn->modes[0];
  for (int i = 0; i < conn->count_modes; i++) {
    if (conn->modes[i].type & DRM_MODE_TYPE_PREFERRED) {
      mode_ = conn->modes[i];
      break;
    }
  }
  connectorId_ = conn->connector_id;
  width_ = mode_.hdisplay;
  height_ = mode_.vdisplay;

  // Current encoder's CRTC, else the first CRTC any encoder can drive.
  crtcId_ = 0;
  if (conn->encoder_id) {
    drmModeEncoder* enc = drmModeGetEncoder(fd_, conn->encoder_id);
    if (enc) {
      crtcId_ = enc->crtc_id;
      drmModeFreeEncoder(enc);
    }
  }
  for (int e = 0; e < conn->count_encoders && crtcId_ == 0; e++) {
    drmModeEncoder* enc = drmModeGetEncoder(fd_, conn->encoders[e]);
    if (!enc) continue;
    for (int c = 0; c < res->count_crtcs; c++) {
      if (enc->possible_crtcs & (1u << c)) {
        crtcId_ = res->crtcs[c];
        break;
      }
    }
    drmModeFreeEncoder(enc);
  }

  drmModeFreeConnector(conn);
  drmModeFreeResources(res);

  if (crtcId_ == 0) {
    return Status::fail(ErrorCode::DeviceUnavailable, "no CRTC for connector");
  }
  savedCrtc_ = drmModeGetCrtc(fd_, crtcId_);
  return Status::success();
}

Status DrmSurface::createGbm() {
  gbm_ = gbm_create_device(fd_);
  if (!gbm_) {
    return Status::fail(ErrorCode::ContextCreationFailed, "gbm_create_device failed");
  }
  gbmSurface_ = gbm_surface_create(gbm_, static_cast<std::uint32_t>(width_),
                                   static_cast<std::uint32_t>(height_),
                                   GBM_FORMAT_XRGB8888,
                                   GBM_BO_USE_SCANOUT | GBM_BO_USE_RENDERING);
  if (!gbmSurface_) {
    return Status::fail(ErrorCode::ContextCreationFailed, "gbm_surface_create failed");
  }
  return Status::success();
}

Status DrmSurface::createEgl() {
  display_ = eglGetDisplay(reinterpret_cast<EGLNativeDisplayType>(gbm_));
  if (display_ == EGL_NO_DISPLAY) {
    return Status::fail(ErrorCode::ContextCreationFailed, "eglGetDisplay failed");
  }
  EGLint major = 0, minor = 0;
  if (!eglInitialize(display_, &major, &minor)) {
    display_ = EGL_NO_DISPLAY;
    return Status::fail(ErrorCode::ContextCreationFailed, "eglInitialize failed");
  }
  if (!eglBindAPI(EGL_OPENGL_ES_API)) {
    return Status::fail(ErrorCode::ContextCreationFailed, "eglBindAPI(GLES) failed");
  }

  static const EGLint configAttribs[] = {
    EGL_SURFACE_TYPE,    EGL_WINDOW_BIT,
    EGL_RED_SIZE,        8,
    EGL_GREEN_SIZE,      8,
    EGL_BLUE_SIZE,       8,
    EGL_ALPHA_SIZE,      0,
    EGL_RENDERABLE_TYPE, EGL_OPENGL_ES2_BIT,
    EGL_NONE
  };
  EGLint count = 0;
  if (!eglChooseConfig(display_, configAttribs, nullptr, 0, &count) || count <= 0) {
    return Status::fail(ErrorCode::ContextCreationFailed, "no EGL config for GLES2");
  }
  std::vector<EGLConfig> configs(static_cast<std::size_t>(count));
  eglChooseConfig(display_, configAttribs, configs.data(), count, &count);

  // The config's native visual must match the gbm surface format.
  eglConfig_ = nullptr;
  for (EGLint i = 0; i < count; i++) {
    EGLint visual = 0;
    if (eglGetConfigAttrib(display_, configs[i], EGL_NATIVE_VISUAL_ID, &visual) &&
        static_cast<std::uint32_t>(visual) == GBM_FORMAT_XRGB8888) {
      eglConfig_ = configs[i];
      break;
    }
  }
  if (!eglConfig_) {
    return Status::fail(ErrorCode::ContextCreationFailed, "no EGL config matching XRGB8888");
  }

  static const EGLint contextAttribs[] = {
    EGL_CONTEXT_CLIENT_VERSION, 2,
    EGL_NONE
  };
  context_ = eglCreateContext(display_, eglConfig_, EGL_NO_CONTEXT, contextAttribs);
  if (context_ == EGL_NO_CONTEXT) {
    return Status::fail(ErrorCode::ContextCreationFailed, "eglCreateContext failed");
  }

  eglSurface_ = eglCreateWindowSurface(display_, eglConfig_,
                                       reinterpret_cast<EGLNativeWindowType>(gbmSurface_),
                                       nullptr);
  if (eglSurface_ == EGL_NO_SURFACE) {
    return Status::fail(ErrorCode::ContextCreationFailed, "eglCreateWindowSurface failed");
  }
  if (!eglMakeCurrent(display_, eglSurface_, eglSurface_, context_)) {
    return Status::fail(ErrorCode::ContextCreationFailed, "eglMakeCurrent failed");
  }

  // Load GLES function pointers via GLAD, using EGL's loader.
  int version = gladLoadGLES2(reinterpret_cast<GLADloadfunc>(eglGetProcAddress));
  if (!version) {
    return Status::fail(ErrorCode::ContextCreationFailed, "gladLoadGLES2 failed");
  }

  // Text coverage and translucent fills rely on source-over blending.
  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  return Status::success();
}

std::vector<std::uint8_t> DrmSurface::readPixels() const {
  std::vector<std::uint8_t> pixels;
  if (!isOpen()) return pixels;
  pixels.resize(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 4);
  glPixelStorei(GL_PACK_ALIGNMENT, 1);
  glReadPixels(0, 0, width_, height_, GL_RGBA, GL_UNSIGNED_BYTE, pixels.data());
  return pixels;
}

bool DrmSurface::framebufferFor(gbm_bo* bo, std::uint32_t& fbId) {
  if (auto* rec = static_cast<FbRecord*>(gbm_bo_get_user_data(bo))) {
    fbId = rec->fbId;
    return true;
  }

  std::uint32_t w = gbm_bo_get_width(bo);
  std::uint32_t h = gbm_bo_get_height(bo);
  std::uint32_t stride = gbm_bo_get_stride(bo);
  std::uint32_t handle = gbm_bo_get_handle(bo).u32;
  std::uint32_t id = 0;
  if (drmModeAddFB(fd_, w, h, 24, 32, stride, handle, &id) != 0) {
    std::fprintf(stderr, "DrmSurface: drmModeAddFB failed: %s\n", std::strerror(errno));
    return false;
  }
  gbm_bo_set_user_data(bo, new FbRecord{fd_, id}, &destroyFbRecord);
  fbId = id;
  return true;
}

void DrmSurface::onPageFlip(int /*fd*/, unsigned int /*frame*/, unsigned int /*sec*/,
                            unsigned int /*usec*/, void* userData) {
  static_cast<DrmSurface*>(userData)->flipPending_ = false;
}

bool DrmSurface::waitForFlip() {
  drmEventContext ev{};
  ev.version = 2;
  ev.page_flip_handler = &DrmSurface::onPageFlip;

  while (flipPending_) {
    pollfd pfd{fd_, POLLIN, 0};
    int r = ::poll(&pfd, 1, config_.flipTimeoutMs);
    if (r < 0) {
      if (errno == EINTR) continue;
      std::fprintf(stderr, "DrmSurface: poll failed: %s\n", std::strerror(errno));
      return false;
    }
    if (r == 0) {
      std::fprintf(stderr, "DrmSurface: page flip timed out after %d ms\n",
                   config_.flipTimeoutMs);
      return false;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      std::fprintf(stderr, "DrmSurface: device error while waiting for flip\n");
      return false;
    }
    if (drmHandleEvent(fd_, &ev) != 0) {
      std::fprintf(stderr, "DrmSurface: drmHandleEvent failed\n");
      return false;
    }
  }
  return true;
}

Status DrmSurface::present() {
  if (!isOpen()) {
    return Status::fail(ErrorCode::PresentFailed, "surface is not open");
  }
  if (scanout_.stalled()) {
    return Status::fail(ErrorCode::PresentFailed, "an earlier page flip never completed");
  }
  if (!eglSwapBuffers(display_, eglSurface_)) {
    return Status::fail(ErrorCode::PresentFailed, "eglSwapBuffers failed");
  }

  gbm_bo* next = gbm_surface_lock_front_buffer(gbmSurface_);
  if (!next) {
    return Status::fail(ErrorCode::PresentFailed, "gbm_surface_lock_front_buffer failed");
  }
  std::uint32_t fb = 0;
  if (!framebufferFor(next, fb)) {
    gbm_surface_release_buffer(gbmSurface_, next);
    return Status::fail(ErrorCode::PresentFailed, "cannot create framebuffer");
  }

  if (!modeSet_) {
    if (drmModeSetCrtc(fd_, crtcId_, fb, 0, 0, &connectorId_, 1, &mode_) != 0) {
      std::string msg = errnoText("drmModeSetCrtc");
      gbm_surface_release_buffer(gbmSurface_, next);
      return Status::fail(ErrorCode::PresentFailed, msg);
    }
    modeSet_ = true;
  } else {
    flipPending_ = true;
    if (drmModePageFlip(fd_, crtcId_, fb, DRM_MODE_PAGE_FLIP_EVENT, this) != 0) {
      std::string msg = errnoText("drmModePageFlip");
      flipPending_ = false;
      gbm_surface_release_buffer(gbmSurface_, next);
      return Status::fail(ErrorCode::PresentFailed, msg);
    }
    if (!waitForFlip()) {
      scanout_.stall(next);
      return Status::fail(ErrorCode::PresentFailed, "page flip did not complete");
    }
  }

  if (gbm_bo* freed = scanout_.commit(next)) {
    gbm_surface_release_buffer(gbmSurface_, freed);
  }
  frames_++;
  return Status::success();
}

void DrmSurface::close() {
  if (savedCrtc_) {
    if (modeSet_ && fd_ >= 0) {
      drmModeSetCrtc(fd_, savedCrtc_->crtc_id, savedCrtc_->buffer_id,
                     savedCrtc_->x, savedCrtc_->y, &connectorId_, 1, &savedCrtc_->mode);
    }
    drmModeFreeCrtc(savedCrtc_);
    savedCrtc_ = nullptr;
  }
  scanout_.releaseAll([this](gbm_bo* bo) {
    if (gbmSurface_) gbm_surface_release_buffer(gbmSurface_, bo);
  });

  if (display_ != EGL_NO_DISPLAY) {
    eglMakeCurrent(display_, EGL_NO_SURFACE, EGL_NO_SURFACE, EGL_NO_CONTEXT);
    if (eglSurface_ != EGL_NO_SURFACE) eglDestroySurface(display_, eglSurface_);
    if (context_ != EGL_NO_CONTEXT) eglDestroyContext(display_, context_);
    eglTerminate(display_);
  }
  eglSurface_ = EGL_NO_SURFACE;
  context_ = EGL_NO_CONTEXT;
  eglConfig_ = nullptr;
  display_ = EGL_NO_DISPLAY;

  if (gbmSurface_) {
    gbm_surface_destroy(gbmSurface_);
    gbmSurface_ = nullptr;
  }
  if (gbm_) {
    gbm_device_destroy(gbm_);
    gbm_ = nullptr;
  }
  if (fd_ >= 0) {
    drmDropMaster(fd_);
    ::close(fd_);
    fd_ = -1;
  }
  modeSet_ = false;
  flipPending_ = false;
}

} // namespace pd
