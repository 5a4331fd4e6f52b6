#pragma once
#include "tc/math/MonthTicks.hpp"
#include "tc/math/NiceTicks.hpp"
#include "tc/recipe/Recipe.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

class GlyphAtlas;

enum class AxisValueFormat : std::uint8_t { Price, Volume };

// Axis recipe for one pane: horizontal grid at nice y ticks, vertical grid at
// month ticks, y labels left of the pane and, when showXAxis is set, a bottom
// spine with x tick marks and month labels under the pane.
//
// Grid lines live in the pane (data transform, clipped to the pane); marks,
// spine and labels live on the overlay layer in pixel coordinates.
//
// ID layout (offsets from idBase, 15 slots):
//   0-2:   H-grid lines  (buf/geom/di) - lineAA@1, data space
//   3-5:   V-grid lines  (buf/geom/di) - lineAA@1, data space
//   6-8:   Tick marks    (buf/geom/di) - lineAA@1, pixels
//   9-11:  Spine         (buf/geom/di) - lineAA@1, pixels
//  12-14:  Labels        (buf/geom/di) - textSDF@1, pixels
struct AxisRecipeConfig {
  Id gridLayerId{0};
  Id labelLayerId{0};
  Id dataTransformId{0};
  Id pixelTransformId{0};
  std::string name;

  PaneRegion region;
  int viewW{0}, viewH{0};

  AxisValueFormat valueFormat{AxisValueFormat::Price};
  int yTargetTicks{5};
  bool showXAxis{false};

  float tickLengthPx{4.0f};
  float labelGapPx{6.0f};
  float fontSize{10.0f};

  float gridColor[4]  {0.5f, 0.5f, 0.5f, 0.5f};
  float tickColor[4]  {0.5f, 0.5f, 0.5f, 1.0f};
  float labelColor[4] {0.5f, 0.5f, 0.5f, 1.0f};
  float gridLineWidth{0.5f};
  float tickLineWidth{1.0f};
};

// "123.45" with as many decimals as the tick step needs.
std::string formatPriceLabel(double value, double step);

// "950", "12K", "2.5M", "1.2B"
std::string formatVolumeLabel(double value);

class AxisRecipe : public Recipe {
public:
  AxisRecipe(Id idBase, const AxisRecipeConfig& config);

  void build(Scene& scene) const override;
  std::vector<Id> drawItemIds() const override {
    return {hGridDrawItemId(), vGridDrawItemId(), tickDrawItemId(),
            spineDrawItemId(), labelDrawItemId()};
  }

  Id hGridDrawItemId() const { return rid(2); }
  Id vGridDrawItemId() const { return rid(5); }
  Id tickDrawItemId() const  { return rid(8); }
  Id spineDrawItemId() const { return rid(11); }
  Id labelDrawItemId() const { return rid(14); }

  static constexpr std::uint32_t ID_SLOTS = 15;

  struct AxisData {
    TickSet yTicks;
    std::vector<float> hGridVerts, vGridVerts;   // rect4, data space
    std::vector<float> tickVerts, spineVerts;    // rect4, pixels
    std::vector<float> labelInstances;           // glyph8, pixels
    std::uint32_t hGridLineCount{0}, vGridLineCount{0};
    std::uint32_t tickCount{0}, spineLineCount{0}, labelGlyphCount{0};
    std::vector<std::string> yLabels, xLabels;   // text of each emitted label
  };

  // atlas may be null: geometry is produced, label glyphs are not.
  AxisData computeAxisData(const GlyphAtlas* atlas,
                           double xMin, double xMax, double yMin, double yMax,
                           const AxisTickSet& xTicks) const;

  void apply(Scene& scene, const AxisData& data) const;

  const AxisRecipeConfig& config() const { return config_; }

private:
  AxisRecipeConfig config_;

  float dataToPixelX(double x, double xMin, double xMax) const;
  float dataToPixelY(double y, double yMin, double yMax) const;
};

} // namespace tc
