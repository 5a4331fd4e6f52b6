#pragma once
#include "tc/recipe/Recipe.hpp"
#include "tc/series/CandleClassifier.hpp"
#include <string>
#include <vector>

namespace tc {

// Candlesticks for one classified group, drawn with instancedCandle@1
// (1 px wick low->high, body open->close). Every candle of the item shares
// the group color.
//
// ID layout (offsets from idBase):
//   0: Buffer (candle6 data)
//   1: Geometry
//   2: DrawItem
struct CandleRecipeConfig {
  Id layerId{0};
  Id transformId{0};   // pane data transform
  std::string name;
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float bodyHalfWidth{0.3f};   // plot-index units
};

class CandleRecipe : public Recipe {
public:
  CandleRecipe(Id idBase, const CandleRecipeConfig& config);

  void build(Scene& scene) const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  struct CandleData {
    std::vector<float> candle6;   // x, open, high, low, close, halfWidth
    std::uint32_t candleCount{0};
  };

  // One record per bar of the group, x = plot index.
  CandleData computeCandles(const ClassifiedGroup& group) const;

  void apply(Scene& scene, const CandleData& data) const;

private:
  CandleRecipeConfig config_;
};

} // namespace tc
