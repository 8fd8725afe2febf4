#include "pd/gl/ShaderProgram.hpp"
#include "pd/gl/Ortho.hpp"

#include <cstdio>
#include <vector>

namespace pd {

namespace {

std::string infoLog(GLuint object, bool isProgram) {
  GLint len = 0;
  if (isProgram) glGetProgramiv(object, GL_INFO_LOG_LENGTH, &len);
  else glGetShaderiv(object, GL_INFO_LOG_LENGTH, &len);
  if (len <= 1) return std::string();

  std::vector<char> buf(static_cast<std::size_t>(len), '\0');
  if (isProgram) glGetProgramInfoLog(object, len, nullptr, buf.data());
  else glGetShaderInfoLog(object, len, nullptr, buf.data());
  return std::string(buf.data());
}

GLuint compileStage(const std::string& label, GLenum stage, const char* src) {
  const char* stageName = stage == GL_VERTEX_SHADER ? "vertex" : "fragment";
  GLuint sh = glCreateShader(stage);
  if (!sh) {
    std::fprintf(stderr, "ShaderProgram[%s]: glCreateShader(%s) failed\n",
                 label.c_str(), stageName);
    return 0;
  }
  glShaderSource(sh, 1, &src, nullptr);
  glCompileShader(sh);

  GLint compiled = 0;
  glGetShaderiv(sh, GL_COMPILE_STATUS, &compiled);
  if (!compiled) {
    std::fprintf(stderr, "ShaderProgram[%s]: %s stage:\n%s\n",
                 label.c_str(), stageName, infoLog(sh, false).c_str());
    glDeleteShader(sh);
    return 0;
  }
  return sh;
}

} // namespace

ShaderProgram::~ShaderProgram() {
  if (program_) glDeleteProgram(program_);
}

Status ShaderProgram::build(const char* label, const char* vertSrc, const char* fragSrc) {
  label_ = label;
  if (program_) {
    glDeleteProgram(program_);
    program_ = 0;
  }

  GLuint vs = compileStage(label_, GL_VERTEX_SHADER, vertSrc);
  GLuint fs = vs ? compileStage(label_, GL_FRAGMENT_SHADER, fragSrc) : 0;
  if (!vs || !fs) {
    if (vs) glDeleteShader(vs);
    return Status::fail(ErrorCode::ContextCreationFailed,
                        label_ + ": shader compile failed");
  }

  GLuint prog = glCreateProgram();
  glAttachShader(prog, vs);
  glAttachShader(prog, fs);
  glBindAttribLocation(prog, kAttribPos, "a_pos");
  glBindAttribLocation(prog, kAttribUv, "a_uv");
  glBindAttribLocation(prog, kAttribColor, "a_color");
  glLinkProgram(prog);
  glDetachShader(prog, vs);
  glDetachShader(prog, fs);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint linked = 0;
  glGetProgramiv(prog, GL_LINK_STATUS, &linked);
  if (!linked) {
    std::fprintf(stderr, "ShaderProgram[%s]: link:\n%s\n",
                 label_.c_str(), infoLog(prog, true).c_str());
    glDeleteProgram(prog);
    return Status::fail(ErrorCode::ContextCreationFailed,
                        label_ + ": shader link failed");
  }

  program_ = prog;
  return Status::success();
}

GLint ShaderProgram::uniform(const char* name) const {
  GLint loc = glGetUniformLocation(program_, name);
  if (loc < 0) {
    std::fprintf(stderr, "ShaderProgram[%s]: no uniform '%s'\n", label_.c_str(), name);
  }
  return loc;
}

void ShaderProgram::setProjection(GLint loc, int width, int height) const {
  float proj[16];
  orthoTopLeft(static_cast<float>(width), static_cast<float>(height), proj);
  glUniformMatrix4fv(loc, 1, GL_FALSE, proj);
}

void ShaderProgram::setSampler(GLint loc, int unit) const {
  glUniform1i(loc, unit);
}

void ShaderProgram::enableAttrib(AttribSlot slot, int components, std::size_t stride,
                                 std::size_t offset) {
  glEnableVertexAttribArray(slot);
  glVertexAttribPointer(slot, components, GL_FLOAT, GL_FALSE,
                        static_cast<GLsizei>(stride),
                        reinterpret_cast<const void*>(offset));
}

void ShaderProgram::disableAttrib(AttribSlot slot) {
  glDisableVertexAttribArray(slot);
}

} // namespace pd
