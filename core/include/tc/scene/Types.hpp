#pragma once
#include <cstdint>
#include <string>

namespace tc {

using Id = std::uint64_t;

inline constexpr Id kInvalidId = 0;

// Pane rectangle in clip space [-1, 1].
struct PaneRegion {
  float clipYMin{-1.0f};
  float clipYMax{1.0f};
  float clipXMin{-1.0f};
  float clipXMax{1.0f};
};

struct Pane {
  Id id{0};
  std::string name;
  PaneRegion region;
  float clearColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  bool hasClearColor{false};
};

struct Layer {
  Id id{0};
  Id paneId{0};
  std::string name;
};

// Affine 2D transform, column-major mat3: m[0]=sx, m[4]=sy, m[6]=tx, m[7]=ty.
struct Transform {
  Id id{0};
  float mat3[9] = {1, 0, 0, 0, 1, 0, 0, 0, 1};
};

struct DrawItem {
  Id id{0};
  Id layerId{0};
  std::string name;

  // bindings for pipeline execution
  std::string pipeline;  // e.g. "triSolid@1"
  Id geometryId{0};      // must refer to a Geometry resource
  Id transformId{0};     // 0 = identity

  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float colorUp[4] = {0.0f, 0.8f, 0.0f, 1.0f};    // instancedCandle@1
  float colorDown[4] = {0.8f, 0.0f, 0.0f, 1.0f};  // instancedCandle@1
  float lineWidth{1.0f};                           // pixels
  bool visible{true};
};

// data-space -> clip-space mapping of [xMin,xMax] x [yMin,yMax] onto a pane region.
inline Transform makeDataTransform(Id id, double xMin, double xMax,
                                   double yMin, double yMax, const PaneRegion& r) {
  Transform t;
  t.id = id;
  double sx = (xMax > xMin) ? (r.clipXMax - r.clipXMin) / (xMax - xMin) : 1.0;
  double sy = (yMax > yMin) ? (r.clipYMax - r.clipYMin) / (yMax - yMin) : 1.0;
  t.mat3[0] = static_cast<float>(sx);
  t.mat3[4] = static_cast<float>(sy);
  t.mat3[6] = static_cast<float>(r.clipXMin - xMin * sx);
  t.mat3[7] = static_cast<float>(r.clipYMin - yMin * sy);
  return t;
}

} // namespace tc
