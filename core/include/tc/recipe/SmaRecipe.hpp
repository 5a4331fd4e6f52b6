#pragma once
#include "tc/recipe/Recipe.hpp"
#include "tc/series/Series.hpp"
#include <string>
#include <vector>

namespace tc {

// SMA overlay recipe. Uses lineAA@1: one rect4 record per segment joining
// two consecutive bars that both have an average. Positions without an
// average produce no segment.
//
// ID layout (offsets from idBase):
//   0: Buffer
//   1: Geometry
//   2: DrawItem
struct SmaRecipeConfig {
  Id layerId{0};
  Id transformId{0};   // pane data transform
  std::string name;
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float lineWidth{1.5f};
};

class SmaRecipe : public Recipe {
public:
  SmaRecipe(Id idBase, const SmaRecipeConfig& config);

  void build(Scene& scene) const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  struct SmaData {
    std::vector<float> segments;   // x0, y0, x1, y1 in data space
    std::uint32_t segmentCount{0};
  };

  SmaData compute(const Series& series) const;

  void apply(Scene& scene, const SmaData& data) const;

private:
  SmaRecipeConfig config_;
};

} // namespace tc
