#include "tc/recipe/TextRecipe.hpp"
#include "tc/scene/Scene.hpp"
#include <cstring>

namespace tc {

TextRecipe::TextRecipe(Id idBase, const TextRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

void TextRecipe::build(Scene& scene) const {
  addBoundItem(scene, 0, config_.layerId, config_.name,
               "textSDF@1", VertexFormat::Glyph8, config_.transformId);
  DrawItem* di = scene.getDrawItemMutable(drawItemId());
  std::memcpy(di->color, config_.color, sizeof(di->color));
}

TextLayoutResult TextRecipe::layout(const GlyphAtlas& atlas, const std::string& text,
                                    float x, float baselineY, TextAlign align) const {
  TextLayoutResult r;
  appendTextLines(r, atlas, text, x, baselineY, config_.fontSize, align);
  return r;
}

void TextRecipe::apply(Scene& scene, const TextLayoutResult& data) const {
  setVertexData(scene, 0, VertexFormat::Glyph8, data.glyphInstances);
}

} // namespace tc
