#include "tc/gl/Renderer.hpp"
#include "tc/scene/Geometry.hpp"
#include "tc/text/GlyphAtlas.hpp"
#include <cmath>
#include <cstdio>

namespace tc {

static const float kIdentityMat3[9] = {1,0,0, 0,1,0, 0,0,1};

static const float* resolveTransform(const DrawItem& di, const Scene& scene) {
  if (!di.transformId) return kIdentityMat3;
  const Transform* t = scene.getTransform(di.transformId);
  return t ? t->mat3 : kIdentityMat3;
}

// ---- triSolid@1 shader ----

static const char* kPos2Vert = R"GLSL(
#version 330 core
in vec2 a_pos;
uniform mat3 u_transform;
void main() {
    vec3 p = u_transform * vec3(a_pos, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kSolidFrag = R"GLSL(
#version 330 core
out vec4 outColor;
uniform vec4 u_color;
void main() {
    outColor = u_color;
}
)GLSL";

// ---- instancedRect@1 shader ----

static const char* kInstRectVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform mat3 u_transform;
void main() {
    int v = gl_VertexID % 6;
    vec2 uv;
    if (v == 0)      uv = vec2(0.0, 0.0);
    else if (v == 1) uv = vec2(1.0, 0.0);
    else if (v == 2) uv = vec2(0.0, 1.0);
    else if (v == 3) uv = vec2(0.0, 1.0);
    else if (v == 4) uv = vec2(1.0, 0.0);
    else             uv = vec2(1.0, 1.0);
    float x = mix(a_rect.x, a_rect.z, uv.x);
    float y = mix(a_rect.y, a_rect.w, uv.y);
    vec3 p = u_transform * vec3(x, y, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

// ---- instancedCandle@1 shader ----

static const char* kInstCandleVert = R"GLSL(
#version 330 core
in vec4 a_c0;
in vec2 a_c1;
uniform mat3 u_transform;
uniform vec2 u_viewportSize;
flat out float v_isUp;
void main() {
    float cx    = a_c0.x;
    float open  = a_c0.y;
    float high  = a_c0.z;
    float low   = a_c0.w;
    float close = a_c1.x;
    float hw    = a_c1.y;

    float body0 = min(open, close);
    float body1 = max(open, close);

    int vid = gl_VertexID % 12;
    bool isWick = (vid >= 6);
    int lid = isWick ? (vid - 6) : vid;

    vec2 uv;
    if (lid == 0)      uv = vec2(0.0, 0.0);
    else if (lid == 1) uv = vec2(1.0, 0.0);
    else if (lid == 2) uv = vec2(0.0, 1.0);
    else if (lid == 3) uv = vec2(0.0, 1.0);
    else if (lid == 4) uv = vec2(1.0, 0.0);
    else               uv = vec2(1.0, 1.0);

    if (isWick) {
        // Fixed 1px wick: transform center, then offset in clip space
        float y = mix(low, high, uv.y);
        vec3 center = u_transform * vec3(cx, y, 1.0);
        float wickClipHW = 1.0 / u_viewportSize.x;
        gl_Position = vec4(center.x + mix(-wickClipHW, wickClipHW, uv.x),
                           center.y, 0.0, 1.0);
    } else {
        // Keep flat bodies (open == close) visible as a 1px line
        vec3 b0 = u_transform * vec3(cx, body0, 1.0);
        vec3 b1 = u_transform * vec3(cx, body1, 1.0);
        float minClipH = 2.0 / u_viewportSize.y;
        float y1 = max(b1.y, b0.y + minClipH);
        vec3 l = u_transform * vec3(cx - hw, body0, 1.0);
        vec3 r = u_transform * vec3(cx + hw, body0, 1.0);
        gl_Position = vec4(mix(l.x, r.x, uv.x), mix(b0.y, y1, uv.y), 0.0, 1.0);
    }
    v_isUp = (close >= open) ? 1.0 : 0.0;
}
)GLSL";

static const char* kInstCandleFrag = R"GLSL(
#version 330 core
out vec4 outColor;
uniform vec4 u_colorUp;
uniform vec4 u_colorDown;
flat in float v_isUp;
void main() {
    outColor = (v_isUp > 0.5) ? u_colorUp : u_colorDown;
}
)GLSL";

// ---- textSDF@1 shader ----

static const char* kTextSdfVert = R"GLSL(
#version 330 core
in vec4 a_g0;
in vec4 a_g1;
uniform mat3 u_transform;
out vec2 v_uv;
void main() {
    int vid = gl_VertexID % 6;
    vec2 uv;
    if (vid == 0)      uv = vec2(0.0, 0.0);
    else if (vid == 1) uv = vec2(1.0, 0.0);
    else if (vid == 2) uv = vec2(0.0, 1.0);
    else if (vid == 3) uv = vec2(0.0, 1.0);
    else if (vid == 4) uv = vec2(1.0, 0.0);
    else               uv = vec2(1.0, 1.0);
    float x = mix(a_g0.x, a_g0.z, uv.x);
    float y = mix(a_g0.y, a_g0.w, uv.y);
    v_uv = vec2(mix(a_g1.x, a_g1.z, uv.x), mix(a_g1.y, a_g1.w, uv.y));
    vec3 p = u_transform * vec3(x, y, 1.0);
    gl_Position = vec4(p.xy, 0.0, 1.0);
}
)GLSL";

static const char* kTextSdfFrag = R"GLSL(
#version 330 core
uniform sampler2D u_atlas;
uniform vec4 u_color;
uniform float u_pxRange;
in vec2 v_uv;
out vec4 outColor;
void main() {
    float val = texture(u_atlas, v_uv).r;
    // u_pxRange < 0 signals raw-alpha mode (no SDF reconstruction)
    float a = (u_pxRange < 0.0) ? val : smoothstep(0.45, 0.55, val);
    outColor = vec4(u_color.rgb, u_color.a * a);
}
)GLSL";

// ---- lineAA@1 shader ----
// Segment quads are extruded in pixel space so the width is the same for
// horizontal and vertical lines whatever the aspect ratio.

static const char* kLineAAVert = R"GLSL(
#version 330 core
in vec4 a_rect;
uniform mat3 u_transform;
uniform vec2 u_viewportSize;
uniform float u_lineWidth;
uniform float u_aaWidth;
out float v_dist;
void main() {
    vec3 c0 = u_transform * vec3(a_rect.xy, 1.0);
    vec3 c1 = u_transform * vec3(a_rect.zw, 1.0);
    vec2 halfView = 0.5 * u_viewportSize;
    vec2 p0 = c0.xy * halfView;
    vec2 p1 = c1.xy * halfView;

    vec2 dir = p1 - p0;
    float len = length(dir);
    vec2 d = (len > 0.0001) ? dir / len : vec2(1.0, 0.0);
    vec2 perp = vec2(-d.y, d.x);

    float hw = max(u_lineWidth * 0.5, 0.5);
    float totalHW = hw + u_aaWidth;

    int vid = gl_VertexID % 6;
    vec2 uv;
    if (vid == 0)      uv = vec2(0.0, -1.0);
    else if (vid == 1) uv = vec2(1.0, -1.0);
    else if (vid == 2) uv = vec2(0.0,  1.0);
    else if (vid == 3) uv = vec2(0.0,  1.0);
    else if (vid == 4) uv = vec2(1.0, -1.0);
    else               uv = vec2(1.0,  1.0);

    vec2 pos = mix(p0, p1, uv.x) + perp * (uv.y * totalHW);
    gl_Position = vec4(pos / halfView, 0.0, 1.0);
    // v_dist: 0 at center, 1.0 at nominal edge, >1.0 in AA fringe
    v_dist = uv.y * totalHW / hw;
}
)GLSL";

static const char* kLineAAFrag = R"GLSL(
#version 330 core
uniform vec4 u_color;
uniform float u_fringeEdge;
uniform float u_coverage;
in float v_dist;
out vec4 outColor;
void main() {
    float d = abs(v_dist);
    float a = 1.0 - smoothstep(1.0, u_fringeEdge, d);
    outColor = vec4(u_color.rgb, u_color.a * a * u_coverage);
}
)GLSL";

// ---- Renderer implementation ----

Renderer::~Renderer() {
  if (vao_) {
    glDeleteVertexArrays(1, &vao_);
  }
  if (atlasTexture_) {
    glDeleteTextures(1, &atlasTexture_);
  }
}

void Renderer::setGlyphAtlas(GlyphAtlas* atlas) {
  atlas_ = atlas;
}

bool Renderer::init() {
  if (!pos2Prog_.build("triSolid", kPos2Vert, kSolidFrag)) return false;
  if (!instRectProg_.build("instancedRect", kInstRectVert, kSolidFrag)) return false;
  if (!instCandleProg_.build("instancedCandle", kInstCandleVert, kInstCandleFrag)) return false;
  if (!textSdfProg_.build("textSDF", kTextSdfVert, kTextSdfFrag)) return false;
  if (!lineAAProg_.build("lineAA", kLineAAVert, kLineAAFrag)) return false;

  glGenVertexArrays(1, &vao_);
  glGenTextures(1, &atlasTexture_);
  inited_ = true;
  return true;
}

// Bind `components` floats at byte `offset` of each `stride`-sized record.
static GLuint bindAttrib(const ShaderProgram& prog, const char* name, int components,
                         GLsizei stride, std::size_t offset, bool instanced) {
  GLint loc = prog.attribLocation(name);
  GLuint a = static_cast<GLuint>(loc);
  glEnableVertexAttribArray(a);
  glVertexAttribPointer(a, components, GL_FLOAT, GL_FALSE, stride,
                        reinterpret_cast<const void*>(offset));
  if (instanced) glVertexAttribDivisor(a, 1);
  return a;
}

static void unbindAttrib(GLuint a, bool instanced) {
  if (instanced) glVertexAttribDivisor(a, 0);
  glDisableVertexAttribArray(a);
}

void Renderer::drawTriSolid(const DrawItem& di, const Geometry& geo, const float* xform,
                            GLuint vbo, Stats& stats) {
  pos2Prog_.use();
  pos2Prog_.setUniformMat3("u_transform", xform);
  pos2Prog_.setUniformVec4("u_color", di.color);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  GLuint a = bindAttrib(pos2Prog_, "a_pos", 2, 0, 0, false);
  glDrawArrays(GL_TRIANGLES, 0, static_cast<GLsizei>(geo.vertexCount));
  stats.drawCalls++;
  unbindAttrib(a, false);
}

void Renderer::drawInstancedRect(const DrawItem& di, const Geometry& geo, const float* xform,
                                 GLuint vbo, Stats& stats) {
  instRectProg_.use();
  instRectProg_.setUniformMat3("u_transform", xform);
  instRectProg_.setUniformVec4("u_color", di.color);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Rect4));
  GLuint a = bindAttrib(instRectProg_, "a_rect", 4, stride, 0, true);
  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  stats.drawCalls++;
  unbindAttrib(a, true);
}

void Renderer::drawInstancedCandle(const DrawItem& di, const Geometry& geo, const float* xform,
                                   GLuint vbo, int viewW, int viewH, Stats& stats) {
  instCandleProg_.use();
  instCandleProg_.setUniformMat3("u_transform", xform);
  instCandleProg_.setUniformVec2("u_viewportSize",
                                 static_cast<float>(viewW), static_cast<float>(viewH));
  instCandleProg_.setUniformVec4("u_colorUp", di.colorUp);
  instCandleProg_.setUniformVec4("u_colorDown", di.colorDown);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Candle6));
  GLuint a0 = bindAttrib(instCandleProg_, "a_c0", 4, stride, 0, true);
  GLuint a1 = bindAttrib(instCandleProg_, "a_c1", 2, stride, 16, true);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 12, static_cast<GLsizei>(geo.vertexCount));
  stats.drawCalls++;

  unbindAttrib(a0, true);
  unbindAttrib(a1, true);
}

void Renderer::uploadAtlasIfDirty() {
  if (!atlas_ || !atlas_->isDirty()) return;

  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  GLsizei sz = static_cast<GLsizei>(atlas_->atlasSize());
  glTexImage2D(GL_TEXTURE_2D, 0, GL_R8, sz, sz, 0,
               GL_RED, GL_UNSIGNED_BYTE, atlas_->atlasData());
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glBindTexture(GL_TEXTURE_2D, 0);
  atlas_->clearDirty();
}

void Renderer::drawTextSdf(const DrawItem& di, const Geometry& geo, const float* xform,
                           GLuint vbo, Stats& stats) {
  if (!atlas_) return;

  textSdfProg_.use();
  textSdfProg_.setUniformMat3("u_transform", xform);
  textSdfProg_.setUniformVec4("u_color", di.color);
  textSdfProg_.setUniformFloat("u_pxRange", atlas_->useSdf() ? 12.0f : -1.0f);

  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, atlasTexture_);
  textSdfProg_.setUniformInt("u_atlas", 0);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Glyph8));
  GLuint a0 = bindAttrib(textSdfProg_, "a_g0", 4, stride, 0, true);
  GLuint a1 = bindAttrib(textSdfProg_, "a_g1", 4, stride, 16, true);

  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  stats.drawCalls++;

  unbindAttrib(a0, true);
  unbindAttrib(a1, true);
  glBindTexture(GL_TEXTURE_2D, 0);
}

void Renderer::drawLineAA(const DrawItem& di, const Geometry& geo, const float* xform,
                          GLuint vbo, int viewW, int viewH, Stats& stats) {
  lineAAProg_.use();
  lineAAProg_.setUniformMat3("u_transform", xform);
  lineAAProg_.setUniformVec4("u_color", di.color);
  lineAAProg_.setUniformVec2("u_viewportSize",
                             static_cast<float>(viewW), static_cast<float>(viewH));

  // Widths under 1px are drawn 1px wide at proportionally lower alpha.
  float width = di.lineWidth;
  float coverage = 1.0f;
  if (width < 1.0f) {
    coverage = width > 0.0f ? width : 0.0f;
    width = 1.0f;
  }
  constexpr float kAAWidthPx = 1.0f;
  float hw = width * 0.5f;
  lineAAProg_.setUniformFloat("u_lineWidth", width);
  lineAAProg_.setUniformFloat("u_aaWidth", kAAWidthPx);
  lineAAProg_.setUniformFloat("u_fringeEdge", (hw + kAAWidthPx) / hw);
  lineAAProg_.setUniformFloat("u_coverage", coverage);

  glBindBuffer(GL_ARRAY_BUFFER, vbo);
  GLsizei stride = static_cast<GLsizei>(strideOf(VertexFormat::Rect4));
  GLuint a = bindAttrib(lineAAProg_, "a_rect", 4, stride, 0, true);
  glDrawArraysInstanced(GL_TRIANGLES, 0, 6, static_cast<GLsizei>(geo.vertexCount));
  stats.drawCalls++;
  unbindAttrib(a, true);
}

Stats Renderer::render(const Scene& scene, GpuBufferManager& gpuBufs,
                       int viewW, int viewH, const float clearColor[4]) {
  Stats stats{};
  if (!inited_) return stats;

  uploadAtlasIfDirty();
  gpuBufs.syncFromScene(scene);
  stats.uploadedBytesThisFrame = gpuBufs.uploadDirty();
  stats.activeBuffers = gpuBufs.bufferCount();

  glViewport(0, 0, viewW, viewH);
  glDisable(GL_SCISSOR_TEST);
  glClearColor(clearColor[0], clearColor[1], clearColor[2], clearColor[3]);
  glClear(GL_COLOR_BUFFER_BIT);

  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

  glBindVertexArray(vao_);
  glEnable(GL_SCISSOR_TEST);

  for (Id paneId : scene.paneIds()) {
    const Pane* pane = scene.getPane(paneId);

    // Convert pane clip region to pixel scissor rect
    int sx = static_cast<int>(std::round((pane->region.clipXMin + 1.0f) / 2.0f * viewW));
    int sy = static_cast<int>(std::round((pane->region.clipYMin + 1.0f) / 2.0f * viewH));
    int sx2 = static_cast<int>(std::round((pane->region.clipXMax + 1.0f) / 2.0f * viewW));
    int sy2 = static_cast<int>(std::round((pane->region.clipYMax + 1.0f) / 2.0f * viewH));
    glScissor(sx, sy, sx2 - sx, sy2 - sy);

    if (pane->hasClearColor) {
      glClearColor(pane->clearColor[0], pane->clearColor[1],
                   pane->clearColor[2], pane->clearColor[3]);
      glClear(GL_COLOR_BUFFER_BIT);
    }

    for (Id layerId : scene.layersOf(paneId)) {
      for (Id diId : scene.drawItemsOf(layerId)) {
        const DrawItem* di = scene.getDrawItem(diId);
        if (!di->visible || di->pipeline.empty()) continue;

        const Geometry* geo = scene.getGeometry(di->geometryId);
        if (!geo || geo->vertexCount == 0) continue;
        GLuint vbo = gpuBufs.getGlBuffer(geo->vertexBufferId);
        if (!vbo) continue;
        const float* xform = resolveTransform(*di, scene);

        if (di->pipeline == "triSolid@1") {
          drawTriSolid(*di, *geo, xform, vbo, stats);
        } else if (di->pipeline == "instancedRect@1") {
          drawInstancedRect(*di, *geo, xform, vbo, stats);
        } else if (di->pipeline == "instancedCandle@1") {
          drawInstancedCandle(*di, *geo, xform, vbo, viewW, viewH, stats);
        } else if (di->pipeline == "textSDF@1") {
          drawTextSdf(*di, *geo, xform, vbo, stats);
        } else if (di->pipeline == "lineAA@1") {
          drawLineAA(*di, *geo, xform, vbo, viewW, viewH, stats);
        } else {
          std::fprintf(stderr, "Renderer: drawItem %llu has unknown pipeline '%s'\n",
                       static_cast<unsigned long long>(diId), di->pipeline.c_str());
        }
      }
    }
  }

  glDisable(GL_SCISSOR_TEST);
  glBindVertexArray(0);
  glDisable(GL_BLEND);
  glFlush();
  return stats;
}

} // namespace tc
