#include "pd/text/TextRenderer.hpp"
#include "pd/text/FontAtlas.hpp"

#include <cstddef>

namespace pd {

static const char* kTextVert = R"GLSL(
#version 100
attribute vec2 a_pos;
attribute vec2 a_uv;
attribute vec4 a_color;
uniform mat4 u_proj;
varying vec2 v_uv;
varying vec4 v_color;
void main() {
    v_uv = a_uv;
    v_color = a_color;
    gl_Position = u_proj * vec4(a_pos, 0.0, 1.0);
}
)GLSL";

// Coverage lives in the single luminance channel.
static const char* kTextFrag = R"GLSL(
#version 100
precision mediump float;
uniform sampler2D u_atlas;
varying vec2 v_uv;
varying vec4 v_color;
void main() {
    float coverage = texture2D(u_atlas, v_uv).r;
    gl_FragColor = vec4(v_color.rgb, v_color.a * coverage);
}
)GLSL";

TextRenderer::~TextRenderer() {
  if (texture_) {
    glDeleteTextures(1, &texture_);
  }
}

Status TextRenderer::init() {
  Status st = program_.build("text", kTextVert, kTextFrag);
  if (!st.ok) return st;
  uProj_ = program_.uniform("u_proj");
  uAtlas_ = program_.uniform("u_atlas");
  return st;
}

std::uint64_t TextRenderer::uploadAtlas(const FontAtlas& atlas) {
  if (uploaded_ == &atlas && texture_) return 0;

  if (!texture_) glGenTextures(1, &texture_);
  glBindTexture(GL_TEXTURE_2D, texture_);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  auto sz = static_cast<GLsizei>(atlas.atlasSize());
  glTexImage2D(GL_TEXTURE_2D, 0, GL_LUMINANCE, sz, sz, 0,
               GL_LUMINANCE, GL_UNSIGNED_BYTE, atlas.atlasData());
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);

  uploaded_ = &atlas;
  return static_cast<std::uint64_t>(sz) * static_cast<std::uint64_t>(sz);
}

Stats TextRenderer::end(int width, int height) {
  Stats s;
  if (!batch_.active()) return s;

  const FontAtlas* atlas = batch_.atlas();
  if (atlas && program_.valid() && !batch_.empty() && width > 0 && height > 0) {
    s.uploadedBytesThisFrame += uploadAtlas(*atlas);

    const auto& verts = batch_.vertices();
    s.uploadedBytesThisFrame += vbo_.upload(verts.data(), verts.size() * sizeof(TextVertex));

    program_.use();
    program_.setProjection(uProj_, width, height);
    glActiveTexture(GL_TEXTURE0);
    glBindTexture(GL_TEXTURE_2D, texture_);
    program_.setSampler(uAtlas_, 0);

    const std::size_t stride = sizeof(TextVertex);
    ShaderProgram::enableAttrib(kAttribPos, 2, stride, offsetof(TextVertex, x));
    ShaderProgram::enableAttrib(kAttribUv, 2, stride, offsetof(TextVertex, u));
    ShaderProgram::enableAttrib(kAttribColor, 4, stride, offsetof(TextVertex, r));
    glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(verts.size()));
    ShaderProgram::disableAttrib(kAttribPos);
    ShaderProgram::disableAttrib(kAttribUv);
    ShaderProgram::disableAttrib(kAttribColor);

    s.drawCalls = 1;
    s.triangles = static_cast<std::uint32_t>(batch_.quadCount() * 2);
  }

  batch_.finish();
  return s;
}

} // namespace pd
