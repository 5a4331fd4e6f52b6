#include "tc/recipe/SmaRecipe.hpp"
#include "tc/scene/Scene.hpp"
#include <cstring>

namespace tc {

SmaRecipe::SmaRecipe(Id idBase, const SmaRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

void SmaRecipe::build(Scene& scene) const {
  addBoundItem(scene, 0, config_.layerId, config_.name,
               "lineAA@1", VertexFormat::Rect4, config_.transformId);
  DrawItem* di = scene.getDrawItemMutable(drawItemId());
  std::memcpy(di->color, config_.color, sizeof(di->color));
  di->lineWidth = config_.lineWidth;
}

SmaRecipe::SmaData SmaRecipe::compute(const Series& series) const {
  SmaData data;
  for (std::size_t i = 1; i < series.size(); i++) {
    const PreparedBar& a = series[i - 1];
    const PreparedBar& b = series[i];
    if (!a.movingAverage || !b.movingAverage) continue;

    data.segments.push_back(static_cast<float>(a.plotIndex));
    data.segments.push_back(static_cast<float>(*a.movingAverage));
    data.segments.push_back(static_cast<float>(b.plotIndex));
    data.segments.push_back(static_cast<float>(*b.movingAverage));
    data.segmentCount++;
  }
  return data;
}

void SmaRecipe::apply(Scene& scene, const SmaData& data) const {
  setVertexData(scene, 0, VertexFormat::Rect4, data.segments);
}

} // namespace tc
