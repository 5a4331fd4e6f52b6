#pragma once
#include "tc/recipe/Recipe.hpp"
#include "tc/series/CandleClassifier.hpp"
#include <string>
#include <vector>

namespace tc {

// Volume bars for one classified group, drawn with instancedRect@1.
// Each bar spans [plotIndex - hw, plotIndex + hw] x [0, volume]; the default
// half-width of 0.5 leaves no gap between neighbouring days.
//
// ID layout (offsets from idBase):
//   0: Buffer (rect4 data)
//   1: Geometry
//   2: DrawItem
struct VolumeRecipeConfig {
  Id layerId{0};
  Id transformId{0};   // pane data transform
  std::string name;
  float color[4] = {0.5f, 0.5f, 0.5f, 1.0f};
  float barHalfWidth{0.5f};
};

class VolumeRecipe : public Recipe {
public:
  VolumeRecipe(Id idBase, const VolumeRecipeConfig& config);

  void build(Scene& scene) const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  struct VolumeData {
    std::vector<float> rect4;   // x0, y0, x1, y1
    std::uint32_t barCount{0};
  };

  VolumeData computeVolumeBars(const ClassifiedGroup& group) const;

  void apply(Scene& scene, const VolumeData& data) const;

private:
  VolumeRecipeConfig config_;
};

} // namespace tc
