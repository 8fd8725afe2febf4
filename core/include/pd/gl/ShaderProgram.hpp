#pragma once
#include "pd/core/Status.hpp"

#include <glad/gles2.h>
#include <cstddef>
#include <string>

namespace pd {

// Vertex attribute slots shared by every program. They are bound by name
// before linking, so vertex layouts never query locations.
enum AttribSlot : GLuint {
  kAttribPos = 0,    // "a_pos"
  kAttribUv = 1,     // "a_uv"
  kAttribColor = 2   // "a_color"
};

// GLSL ES 1.00 program. Requires a current context.
class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile both stages, bind the attribute slots and link. Compiler and
  // linker logs go to stderr tagged with `label`.
  Status build(const char* label, const char* vertSrc, const char* fragSrc);

  void use() const { glUseProgram(program_); }
  bool valid() const { return program_ != 0; }
  const std::string& label() const { return label_; }

  GLint uniform(const char* name) const;

  // Upload the top-left ortho projection for a width x height target.
  void setProjection(GLint loc, int width, int height) const;
  void setSampler(GLint loc, int unit) const;

  // Point `slot` at `components` floats starting `offset` bytes into each
  // interleaved vertex of the bound array buffer.
  static void enableAttrib(AttribSlot slot, int components, std::size_t stride,
                           std::size_t offset);
  static void disableAttrib(AttribSlot slot);

private:
  GLuint program_{0};
  std::string label_;
};

} // namespace pd
