#pragma once
#include "tc/debug/Stats.hpp"
#include "tc/gl/GpuBufferManager.hpp"
#include "tc/gl/ShaderProgram.hpp"
#include "tc/scene/Scene.hpp"
#include <glad/gl.h>

namespace tc {

class GlyphAtlas;

// Draws a Scene pane by pane (ascending id), each pane scissored to its
// region and optionally cleared to its own color first.
class Renderer {
public:
  Renderer() = default;
  ~Renderer();

  Renderer(const Renderer&) = delete;
  Renderer& operator=(const Renderer&) = delete;

  // Compile shaders, create VAO. Call once after GL context is current.
  bool init();

  // Optional: set glyph atlas for textSDF@1 rendering.
  void setGlyphAtlas(GlyphAtlas* atlas);

  // Walk the scene and issue draw calls. The whole target is first cleared to clearColor.
  Stats render(const Scene& scene, GpuBufferManager& gpuBufs, int viewW, int viewH,
               const float clearColor[4]);

private:
  ShaderProgram pos2Prog_;        // triSolid@1
  ShaderProgram instRectProg_;    // instancedRect@1
  ShaderProgram instCandleProg_;  // instancedCandle@1
  ShaderProgram textSdfProg_;     // textSDF@1
  ShaderProgram lineAAProg_;      // lineAA@1
  GLuint vao_{0};
  GLuint atlasTexture_{0};
  bool inited_{false};

  GlyphAtlas* atlas_{nullptr};

  void drawTriSolid(const DrawItem& di, const Geometry& geo, const float* xform,
                    GLuint vbo, Stats& stats);
  void drawInstancedRect(const DrawItem& di, const Geometry& geo, const float* xform,
                         GLuint vbo, Stats& stats);
  void drawInstancedCandle(const DrawItem& di, const Geometry& geo, const float* xform,
                           GLuint vbo, int viewW, int viewH, Stats& stats);
  void drawTextSdf(const DrawItem& di, const Geometry& geo, const float* xform,
                   GLuint vbo, Stats& stats);
  void drawLineAA(const DrawItem& di, const Geometry& geo, const float* xform,
                  GLuint vbo, int viewW, int viewH, Stats& stats);

  void uploadAtlasIfDirty();
};

} // namespace tc
