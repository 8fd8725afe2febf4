#include "pd/render/ColorPipeline.hpp"
#include "pd/render/ColorBatch.hpp"

#include <cstddef>

namespace pd {

static const char* kColorVert = R"GLSL(
#version 100
attribute vec2 a_pos;
attribute vec4 a_color;
uniform mat4 u_proj;
varying vec4 v_color;
void main() {
    v_color = a_color;
    gl_Position = u_proj * vec4(a_pos, 0.0, 1.0);
}
)GLSL";

static const char* kColorFrag = R"GLSL(
#version 100
precision mediump float;
varying vec4 v_color;
void main() {
    gl_FragColor = v_color;
}
)GLSL";

Status ColorPipeline::init(const char* label) {
  Status st = program_.build(label, kColorVert, kColorFrag);
  if (!st.ok) return st;
  uProj_ = program_.uniform("u_proj");
  return st;
}

Stats ColorPipeline::draw(const ColorBatch& batch, int width, int height) {
  Stats s;
  if (!ready() || batch.empty() || width <= 0 || height <= 0) return s;

  const auto& verts = batch.vertices();
  s.uploadedBytesThisFrame = vbo_.upload(verts.data(), verts.size() * sizeof(ColorVertex));

  program_.use();
  program_.setProjection(uProj_, width, height);

  ShaderProgram::enableAttrib(kAttribPos, 2, sizeof(ColorVertex), offsetof(ColorVertex, x));
  ShaderProgram::enableAttrib(kAttribColor, 4, sizeof(ColorVertex), offsetof(ColorVertex, r));
  glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(verts.size()));
  ShaderProgram::disableAttrib(kAttribPos);
  ShaderProgram::disableAttrib(kAttribColor);

  s.drawCalls = 1;
  s.triangles = static_cast<std::uint32_t>(batch.triangleCount());
  return s;
}

} // namespace pd
