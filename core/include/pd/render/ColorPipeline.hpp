#pragma once
#include "pd/debug/Stats.hpp"
#include "pd/gl/ShaderProgram.hpp"
#include "pd/gl/StreamBuffer.hpp"

namespace pd {

class ColorBatch;

// Draws a ColorBatch as one GL_TRIANGLES call under a top-left ortho
// projection.
class ColorPipeline {
public:
  Status init(const char* label);
  bool ready() const { return program_.valid(); }

  Stats draw(const ColorBatch& batch, int width, int height);

private:
  ShaderProgram program_;
  StreamBuffer vbo_;
  GLint uProj_{-1};
};

} // namespace pd
