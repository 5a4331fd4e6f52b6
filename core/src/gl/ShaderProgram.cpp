#include "tc/gl/ShaderProgram.hpp"
#include <cstdio>
#include <vector>

namespace tc {

ShaderProgram::~ShaderProgram() {
  if (program_) {
    glDeleteProgram(program_);
  }
}

static GLuint compileShader(const char* name, GLenum type, const char* src) {
  GLuint s = glCreateShader(type);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetShaderInfoLog(s, len, nullptr, log.data());
    std::fprintf(stderr, "ShaderProgram: %s %s shader compile error:\n%s\n", name,
                 type == GL_VERTEX_SHADER ? "vertex" : "fragment", log.data());
    glDeleteShader(s);
    return 0;
  }
  return s;
}

bool ShaderProgram::build(const char* name, const char* vertSrc, const char* fragSrc) {
  GLuint vs = compileShader(name, GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;

  GLuint fs = compileShader(name, GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) { glDeleteShader(vs); return false; }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);

  // Shaders can be deleted after linking.
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (!ok) {
    GLint len = 0;
    glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
    std::vector<char> log(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
    glGetProgramInfoLog(program_, len, nullptr, log.data());
    std::fprintf(stderr, "ShaderProgram: %s link error:\n%s\n", name, log.data());
    glDeleteProgram(program_);
    program_ = 0;
    return false;
  }
  return true;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attribLocation(const char* name) const {
  return glGetAttribLocation(program_, name);
}

GLint ShaderProgram::uniformLocation(const char* name) const {
  return glGetUniformLocation(program_, name);
}

void ShaderProgram::setUniformMat3(const char* name, const float* data) const {
  glUniformMatrix3fv(uniformLocation(name), 1, GL_FALSE, data);
}

void ShaderProgram::setUniformVec4(const char* name, const float* rgba) const {
  glUniform4f(uniformLocation(name), rgba[0], rgba[1], rgba[2], rgba[3]);
}

void ShaderProgram::setUniformVec2(const char* name, float x, float y) const {
  glUniform2f(uniformLocation(name), x, y);
}

void ShaderProgram::setUniformFloat(const char* name, float v) const {
  glUniform1f(uniformLocation(name), v);
}

void ShaderProgram::setUniformInt(const char* name, int v) const {
  glUniform1i(uniformLocation(name), v);
}

} // namespace tc
