#include "pd/gl/StreamBuffer.hpp"

namespace pd {

StreamBuffer::~StreamBuffer() {
  if (vbo_) {
    glDeleteBuffers(1, &vbo_);
  }
}

std::uint64_t StreamBuffer::upload(const void* data, std::size_t bytes) {
  if (!vbo_) {
    glGenBuffers(1, &vbo_);
  }
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  if (bytes > capacity_) {
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(bytes), data, GL_DYNAMIC_DRAW);
    capacity_ = bytes;
  } else if (bytes > 0) {
    glBufferSubData(GL_ARRAY_BUFFER, 0, static_cast<GLsizeiptr>(bytes), data);
  }
  return bytes;
}

} // namespace pd
