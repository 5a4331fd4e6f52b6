#pragma once
#include "tc/layout/PaneLayout.hpp"
#include "tc/math/MonthTicks.hpp"
#include "tc/scene/Scene.hpp"
#include "tc/series/CandleClassifier.hpp"
#include "tc/series/Series.hpp"
#include "tc/series/TrendClassifier.hpp"
#include "tc/style/Theme.hpp"
#include <optional>
#include <string>

namespace tc {

class GlyphAtlas;

struct ChartSceneInputs {
  const Series* series{nullptr};
  const CandleGroups* groups{nullptr};
  const AxisTickSet* ticks{nullptr};
  std::optional<TrendStatus> trend;
  std::string symbol;
};

struct ChartSceneOptions {
  int width{1200};
  int height{800};
  Theme theme;
  PaneMargins margins;
  float paneGapPx{10.0f};
  float priceFraction{3.0f};
  float volumeFraction{1.0f};
  float titleFontSize{16.0f};
  float statusFontSize{10.0f};
  float axisFontSize{10.0f};
  float candleHalfWidth{0.3f};
  float volumeHalfWidth{0.5f};
  double rangeMargin{0.05};   // fraction of the data span added above and below
};

// Well-known resource IDs of the chart scene. Panes draw in ascending order:
// background, price, volume, then the full-frame overlay carrying text.
namespace chart_ids {
inline constexpr Id kBackgroundPane = 1;
inline constexpr Id kPricePane      = 2;
inline constexpr Id kVolumePane     = 3;
inline constexpr Id kOverlayPane    = 4;

inline constexpr Id kPriceGridLayer    = 11;
inline constexpr Id kPriceSeriesLayer  = 12;
inline constexpr Id kVolumeGridLayer   = 13;
inline constexpr Id kVolumeSeriesLayer = 14;
inline constexpr Id kOverlayLayer      = 15;

inline constexpr Id kPriceTransform  = 20;
inline constexpr Id kVolumeTransform = 21;
inline constexpr Id kPixelTransform  = 22;

inline constexpr Id kCandleUpBase   = 100;
inline constexpr Id kCandleDownBase = 110;
inline constexpr Id kSmaBase        = 120;
inline constexpr Id kVolumeUpBase   = 130;
inline constexpr Id kVolumeDownBase = 140;
inline constexpr Id kPriceAxisBase  = 200;
inline constexpr Id kVolumeAxisBase = 300;
inline constexpr Id kTitleBase      = 400;
inline constexpr Id kStatusBase     = 410;
inline constexpr Id kMarkerBase     = 420;
} // namespace chart_ids

struct ChartScene {
  Scene scene;
  int width{0};
  int height{0};
  float clearColor[4] = {0.0f, 0.0f, 0.0f, 1.0f};

  PaneRegion priceRegion, volumeRegion;
  double xMin{0}, xMax{0};
  double priceMin{0}, priceMax{0};
  double volumeMin{0}, volumeMax{0};

  std::vector<std::string> xLabels;   // under the volume pane
  std::vector<std::string> priceLabels, volumeLabels;
  std::string title;
  std::string statusText;             // empty when there is no trend status
};

// Compose the immutable description of the chart. The atlas may be null, in
// which case text draw items are created empty.
// Throws EmptySeriesError when the series has no bars.
ChartScene buildChartScene(const ChartSceneInputs& inputs, const ChartSceneOptions& options,
                           const GlyphAtlas* atlas);

} // namespace tc
