#include "tc/recipe/MarkerRecipe.hpp"
#include "tc/scene/Scene.hpp"
#include <cmath>
#include <cstring>

namespace tc {

MarkerRecipe::MarkerRecipe(Id idBase, const MarkerRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

void MarkerRecipe::build(Scene& scene) const {
  addBoundItem(scene, 0, config_.layerId, config_.name,
               "triSolid@1", VertexFormat::Pos2_Clip, config_.transformId);
  DrawItem* di = scene.getDrawItemMutable(drawItemId());
  std::memcpy(di->color, config_.color, sizeof(di->color));
}

std::vector<float> MarkerRecipe::computeDisc(float cx, float cy) const {
  constexpr float kTwoPi = 6.28318530718f;
  int n = config_.segments < 3 ? 3 : config_.segments;
  std::vector<float> out;
  out.reserve(static_cast<std::size_t>(n) * 6);
  for (int i = 0; i < n; i++) {
    float a0 = kTwoPi * static_cast<float>(i) / static_cast<float>(n);
    float a1 = kTwoPi * static_cast<float>(i + 1) / static_cast<float>(n);
    out.push_back(cx); out.push_back(cy);
    out.push_back(cx + config_.radius * std::cos(a0));
    out.push_back(cy + config_.radius * std::sin(a0));
    out.push_back(cx + config_.radius * std::cos(a1));
    out.push_back(cy + config_.radius * std::sin(a1));
  }
  return out;
}

void MarkerRecipe::apply(Scene& scene, const std::vector<float>& triangles) const {
  setVertexData(scene, 0, VertexFormat::Pos2_Clip, triangles);
}

} // namespace tc
