#include "tc/recipe/VolumeRecipe.hpp"
#include "tc/scene/Scene.hpp"
#include <cstring>

namespace tc {

VolumeRecipe::VolumeRecipe(Id idBase, const VolumeRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

void VolumeRecipe::build(Scene& scene) const {
  addBoundItem(scene, 0, config_.layerId, config_.name,
               "instancedRect@1", VertexFormat::Rect4, config_.transformId);
  DrawItem* di = scene.getDrawItemMutable(drawItemId());
  std::memcpy(di->color, config_.color, sizeof(di->color));
}

VolumeRecipe::VolumeData VolumeRecipe::computeVolumeBars(const ClassifiedGroup& group) const {
  VolumeData data;
  data.rect4.reserve(group.size() * 4);
  for (std::size_t i = 0; i < group.size(); i++) {
    const PreparedBar& pb = group[i];
    float x = static_cast<float>(pb.plotIndex);
    data.rect4.push_back(x - config_.barHalfWidth);
    data.rect4.push_back(0.0f);
    data.rect4.push_back(x + config_.barHalfWidth);
    data.rect4.push_back(static_cast<float>(pb.bar.volume));
  }
  data.barCount = static_cast<std::uint32_t>(group.size());
  return data;
}

void VolumeRecipe::apply(Scene& scene, const VolumeData& data) const {
  setVertexData(scene, 0, VertexFormat::Rect4, data.rect4);
}

} // namespace tc
