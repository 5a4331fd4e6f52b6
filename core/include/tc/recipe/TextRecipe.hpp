#pragma once
#include "tc/recipe/Recipe.hpp"
#include "tc/text/TextLayout.hpp"
#include <string>
#include <vector>

namespace tc {

// A text recipe creates: buffer, geometry, drawItem, and binds to textSDF@1.
// Positions are pixels (bottom-left origin) through a pixel->clip transform.
//
// ID layout (offsets from idBase):
//   0: Buffer (glyph8 data)
//   1: Geometry
//   2: DrawItem
struct TextRecipeConfig {
  Id layerId{0};
  Id transformId{0};
  std::string name;
  float color[4] = {1.0f, 1.0f, 1.0f, 1.0f};
  float fontSize{12.0f};
};

class TextRecipe : public Recipe {
public:
  TextRecipe(Id idBase, const TextRecipeConfig& config);

  void build(Scene& scene) const override;
  std::vector<Id> drawItemIds() const override { return {drawItemId()}; }

  Id bufferId() const    { return rid(0); }
  Id geometryId() const  { return rid(1); }
  Id drawItemId() const  { return rid(2); }

  static constexpr std::uint32_t ID_SLOTS = 3;

  TextLayoutResult layout(const GlyphAtlas& atlas, const std::string& text,
                          float x, float baselineY, TextAlign align = TextAlign::Left) const;

  void apply(Scene& scene, const TextLayoutResult& data) const;

private:
  TextRecipeConfig config_;
};

} // namespace tc
