#pragma once
#include "tc/recipe/Recipe.hpp"
#include <string>
#include <vector>

namespace tc {

// Filled disc drawn with triSolid@1 (triangle fan unrolled to a list).
//
// ID layout (offsets from idBase):
//   0: Buffer (pos2 data)
//   1: Geometry
//   2: DrawItem
struct MarkerRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float radius{4.0f};
  int segments{24};
};

class MarkerRecipe : public Recipe {
public:
  MarkerRecipe(Id idBase, const MarkerRecipeConfig& config);

  void build(Scene& scene) const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id drawItemId() const { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  // segments triangles around (cx, cy).
  std::vector<float> computeDisc(float cx, float cy) const;

  void apply(Scene& scene, const std::vector<float>& triangles) const;

private:
  MarkerRecipeConfig config_;
};

} // namespace tc
