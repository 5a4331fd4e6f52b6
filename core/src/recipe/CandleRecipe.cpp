#include "tc/recipe/CandleRecipe.hpp"
#include "tc/scene/Scene.hpp"
#include <cstring>

namespace tc {

CandleRecipe::CandleRecipe(Id idBase, const CandleRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

void CandleRecipe::build(Scene& scene) const {
  addBoundItem(scene, 0, config_.layerId, config_.name,
               "instancedCandle@1", VertexFormat::Candle6, config_.transformId);

  DrawItem* di = scene.getDrawItemMutable(drawItemId());
  std::memcpy(di->colorUp, config_.color, sizeof(di->colorUp));
  std::memcpy(di->colorDown, config_.color, sizeof(di->colorDown));
}

CandleRecipe::CandleData CandleRecipe::computeCandles(const ClassifiedGroup& group) const {
  CandleData data;
  data.candle6.reserve(group.size() * 6);
  for (std::size_t i = 0; i < group.size(); i++) {
    const PreparedBar& pb = group[i];
    data.candle6.push_back(static_cast<float>(pb.plotIndex));
    data.candle6.push_back(static_cast<float>(pb.bar.open));
    data.candle6.push_back(static_cast<float>(pb.bar.high));
    data.candle6.push_back(static_cast<float>(pb.bar.low));
    data.candle6.push_back(static_cast<float>(pb.bar.close));
    data.candle6.push_back(config_.bodyHalfWidth);
  }
  data.candleCount = static_cast<std::uint32_t>(group.size());
  return data;
}

void CandleRecipe::apply(Scene& scene, const CandleData& data) const {
  setVertexData(scene, 0, VertexFormat::Candle6, data.candle6);
}

} // namespace tc
