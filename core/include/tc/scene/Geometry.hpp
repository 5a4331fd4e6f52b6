#pragma once
#include "tc/scene/Types.hpp"
#include <cstdint>
#include <vector>

namespace tc {

enum class VertexFormat : std::uint8_t {
  Pos2_Clip = 1, // vec2 position
  Rect4,         // x0,y0,x1,y1 (instancedRect@1, lineAA@1 segment endpoints)
  Candle6,       // x,open,high,low,close,halfWidth
  Glyph8         // x0,y0,x1,y1,u0,v0,u1,v1
};

inline const char* toString(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Clip: return "pos2_clip";
    case VertexFormat::Rect4: return "rect4";
    case VertexFormat::Candle6: return "candle6";
    case VertexFormat::Glyph8: return "glyph8";
    default: return "unknown";
  }
}

// Bytes per vertex (or per instance for instanced formats).
inline std::uint32_t strideOf(VertexFormat f) {
  switch (f) {
    case VertexFormat::Pos2_Clip: return 8;
    case VertexFormat::Rect4: return 16;
    case VertexFormat::Candle6: return 24;
    case VertexFormat::Glyph8: return 32;
    default: return 0;
  }
}

struct Buffer {
  Id id{0};
  std::vector<std::uint8_t> data;
  std::uint32_t byteLength() const { return static_cast<std::uint32_t>(data.size()); }
};

struct Geometry {
  Id id{0};
  Id vertexBufferId{0};
  VertexFormat format{VertexFormat::Pos2_Clip};
  std::uint32_t vertexCount{0}; // vertices, or instances for instanced formats
};

} // namespace tc
