#pragma once
#include <glad/gles2.h>
#include <cstddef>
#include <cstdint>

namespace pd {

// One GL_ARRAY_BUFFER re-filled every frame. Storage grows to the largest
// upload seen and is then updated in place.
class StreamBuffer {
public:
  StreamBuffer() = default;
  ~StreamBuffer();

  StreamBuffer(const StreamBuffer&) = delete;
  StreamBuffer& operator=(const StreamBuffer&) = delete;

  // Uploads `bytes` and leaves the buffer bound. Returns bytes uploaded.
  std::uint64_t upload(const void* data, std::size_t bytes);

  GLuint id() const { return vbo_; }

private:
  GLuint vbo_{0};
  std::size_t capacity_{0};
};

} // namespace pd
