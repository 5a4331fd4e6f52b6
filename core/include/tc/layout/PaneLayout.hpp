#pragma once
#include "tc/scene/Types.hpp"
#include <vector>

namespace tc {

// Outer figure margins in pixels (room for axis labels and the title).
struct PaneMargins {
  float left{70.0f};
  float right{20.0f};
  float top{20.0f};
  float bottom{50.0f};
};

// Compute clip-space regions for N panes stacked vertically.
// fractions: relative sizes (e.g. {3, 1} for 75%/25%).
// gapPx: spacing between panes in pixels.
inline std::vector<PaneRegion> computePaneLayout(
    const std::vector<float>& fractions, int viewW, int viewH,
    const PaneMargins& margins = PaneMargins{}, float gapPx = 10.0f) {
  std::vector<PaneRegion> result;
  if (fractions.empty() || viewW <= 0 || viewH <= 0) return result;

  float totalFrac = 0.0f;
  for (float f : fractions) totalFrac += f;
  if (totalFrac <= 0.0f) return result;

  // pixels -> clip units
  float px = 2.0f / static_cast<float>(viewW);
  float py = 2.0f / static_cast<float>(viewH);

  float totalGap = gapPx * py * static_cast<float>(fractions.size() - 1);
  float availableY = 2.0f - (margins.top + margins.bottom) * py - totalGap;
  float topY = 1.0f - margins.top * py;

  for (std::size_t i = 0; i < fractions.size(); i++) {
    float height = availableY * (fractions[i] / totalFrac);
    PaneRegion r;
    r.clipYMax = topY;
    r.clipYMin = topY - height;
    r.clipXMin = -1.0f + margins.left * px;
    r.clipXMax = 1.0f - margins.right * px;
    result.push_back(r);
    topY = r.clipYMin - gapPx * py;
  }

  return result;
}

// Clip-space coordinate -> pixel coordinate (origin bottom-left).
inline float clipToPixelX(float clipX, int viewW) {
  return (clipX + 1.0f) * 0.5f * static_cast<float>(viewW);
}
inline float clipToPixelY(float clipY, int viewH) {
  return (clipY + 1.0f) * 0.5f * static_cast<float>(viewH);
}

} // namespace tc
