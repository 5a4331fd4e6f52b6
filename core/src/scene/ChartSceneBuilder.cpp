#include "tc/scene/ChartSceneBuilder.hpp"
#include "tc/data/Errors.hpp"
#include "tc/recipe/AxisRecipe.hpp"
#include "tc/recipe/CandleRecipe.hpp"
#include "tc/recipe/MarkerRecipe.hpp"
#include "tc/recipe/SmaRecipe.hpp"
#include "tc/recipe/TextRecipe.hpp"
#include "tc/recipe/VolumeRecipe.hpp"
#include "tc/text/GlyphAtlas.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace tc {

using namespace chart_ids;

// Pad [lo, hi] by `margin` of its span; a flat range gets 1% of its value.
static void padRange(double& lo, double& hi, double margin) {
  double span = hi - lo;
  if (span <= 0.0) {
    double pad = std::fabs(lo) * 0.01;
    if (pad == 0.0) pad = 1.0;
    lo -= pad;
    hi += pad;
    return;
  }
  lo -= span * margin;
  hi += span * margin;
}

static void addPane(Scene& scene, Id id, const char* name, const PaneRegion& region,
                    const float* clearColor) {
  Pane p;
  p.id = id;
  p.name = name;
  p.region = region;
  if (clearColor) {
    std::memcpy(p.clearColor, clearColor, sizeof(p.clearColor));
    p.hasClearColor = true;
  }
  scene.addPane(p);
}

static void addLayer(Scene& scene, Id id, Id paneId, const char* name) {
  Layer l;
  l.id = id;
  l.paneId = paneId;
  l.name = name;
  scene.addLayer(l);
}

ChartScene buildChartScene(const ChartSceneInputs& inputs, const ChartSceneOptions& options,
                           const GlyphAtlas* atlas) {
  if (!inputs.series || inputs.series->empty()) {
    throw EmptySeriesError("nothing to render: the prepared series is empty");
  }
  const Series& series = *inputs.series;
  const Theme& theme = options.theme;

  CandleGroups localGroups;
  const CandleGroups* groups = inputs.groups;
  if (!groups) {
    localGroups = classifyCandles(series);
    groups = &localGroups;
  }
  static const AxisTickSet kNoTicks;
  const AxisTickSet& ticks = inputs.ticks ? *inputs.ticks : kNoTicks;

  ChartScene out;
  out.width = options.width;
  out.height = options.height;
  std::memcpy(out.clearColor, theme.backgroundColor, sizeof(out.clearColor));
  Scene& scene = out.scene;

  // Layout: price 3 parts, volume 1 part, sharing the x extent.
  auto regions = computePaneLayout({options.priceFraction, options.volumeFraction},
                                   options.width, options.height,
                                   options.margins, options.paneGapPx);
  if (regions.size() != 2) {
    throw RenderError("cannot lay out panes for a " + std::to_string(options.width) + "x" +
                      std::to_string(options.height) + " image");
  }
  out.priceRegion = regions[0];
  out.volumeRegion = regions[1];

  PaneRegion full;
  addPane(scene, kBackgroundPane, "background", full, theme.backgroundColor);
  addPane(scene, kPricePane, "price", out.priceRegion, nullptr);
  addPane(scene, kVolumePane, "volume", out.volumeRegion, nullptr);
  addPane(scene, kOverlayPane, "overlay", full, nullptr);

  addLayer(scene, kPriceGridLayer, kPricePane, "priceGrid");
  addLayer(scene, kPriceSeriesLayer, kPricePane, "priceSeries");
  addLayer(scene, kVolumeGridLayer, kVolumePane, "volumeGrid");
  addLayer(scene, kVolumeSeriesLayer, kVolumePane, "volumeSeries");
  addLayer(scene, kOverlayLayer, kOverlayPane, "overlay");

  // Data ranges
  out.xMin = -1.0;
  out.xMax = static_cast<double>(series.size());

  double lo = series[0].bar.low, hi = series[0].bar.high;
  double maxVol = 0.0;
  for (const PreparedBar& pb : series.bars()) {
    lo = std::min(lo, pb.bar.low);
    hi = std::max(hi, pb.bar.high);
    if (pb.movingAverage) {
      lo = std::min(lo, *pb.movingAverage);
      hi = std::max(hi, *pb.movingAverage);
    }
    maxVol = std::max(maxVol, static_cast<double>(pb.bar.volume));
  }
  padRange(lo, hi, options.rangeMargin);
  out.priceMin = lo;
  out.priceMax = hi;
  out.volumeMin = 0.0;
  out.volumeMax = maxVol > 0.0 ? maxVol * (1.0 + options.rangeMargin) : 1.0;

  scene.addTransform(makeDataTransform(kPriceTransform, out.xMin, out.xMax,
                                       out.priceMin, out.priceMax, out.priceRegion));
  scene.addTransform(makeDataTransform(kVolumeTransform, out.xMin, out.xMax,
                                       out.volumeMin, out.volumeMax, out.volumeRegion));
  // pixels (bottom-left origin) -> clip
  Transform pixel;
  pixel.id = kPixelTransform;
  pixel.mat3[0] = 2.0f / static_cast<float>(options.width);
  pixel.mat3[4] = 2.0f / static_cast<float>(options.height);
  pixel.mat3[6] = -1.0f;
  pixel.mat3[7] = -1.0f;
  scene.addTransform(pixel);

  // Grid and axes
  AxisRecipeConfig axisCfg;
  axisCfg.labelLayerId = kOverlayLayer;
  axisCfg.pixelTransformId = kPixelTransform;
  axisCfg.viewW = options.width;
  axisCfg.viewH = options.height;
  axisCfg.fontSize = options.axisFontSize;
  std::memcpy(axisCfg.gridColor, theme.gridColor, sizeof(axisCfg.gridColor));
  std::memcpy(axisCfg.tickColor, theme.tickColor, sizeof(axisCfg.tickColor));
  std::memcpy(axisCfg.labelColor, theme.labelColor, sizeof(axisCfg.labelColor));
  axisCfg.gridLineWidth = theme.gridLineWidth;
  axisCfg.tickLineWidth = theme.tickLineWidth;

  AxisRecipeConfig priceAxisCfg = axisCfg;
  priceAxisCfg.name = "priceAxis";
  priceAxisCfg.gridLayerId = kPriceGridLayer;
  priceAxisCfg.dataTransformId = kPriceTransform;
  priceAxisCfg.region = out.priceRegion;
  priceAxisCfg.valueFormat = AxisValueFormat::Price;
  priceAxisCfg.yTargetTicks = 6;
  priceAxisCfg.showXAxis = false;
  AxisRecipe priceAxis(kPriceAxisBase, priceAxisCfg);
  priceAxis.build(scene);
  auto priceAxisData = priceAxis.computeAxisData(atlas, out.xMin, out.xMax,
                                                 out.priceMin, out.priceMax, ticks);
  priceAxis.apply(scene, priceAxisData);
  out.priceLabels = priceAxisData.yLabels;

  AxisRecipeConfig volumeAxisCfg = axisCfg;
  volumeAxisCfg.name = "volumeAxis";
  volumeAxisCfg.gridLayerId = kVolumeGridLayer;
  volumeAxisCfg.dataTransformId = kVolumeTransform;
  volumeAxisCfg.region = out.volumeRegion;
  volumeAxisCfg.valueFormat = AxisValueFormat::Volume;
  volumeAxisCfg.yTargetTicks = 3;
  volumeAxisCfg.showXAxis = true;
  AxisRecipe volumeAxis(kVolumeAxisBase, volumeAxisCfg);
  volumeAxis.build(scene);
  auto volumeAxisData = volumeAxis.computeAxisData(atlas, out.xMin, out.xMax,
                                                   out.volumeMin, out.volumeMax, ticks);
  volumeAxis.apply(scene, volumeAxisData);
  out.volumeLabels = volumeAxisData.yLabels;
  out.xLabels = volumeAxisData.xLabels;

  // Candles, one draw item per group
  auto addCandles = [&](Id base, const char* name, const float* color,
                        const ClassifiedGroup& group) {
    CandleRecipeConfig cfg;
    cfg.layerId = kPriceSeriesLayer;
    cfg.transformId = kPriceTransform;
    cfg.name = name;
    std::memcpy(cfg.color, color, sizeof(cfg.color));
    cfg.bodyHalfWidth = options.candleHalfWidth;
    CandleRecipe recipe(base, cfg);
    recipe.build(scene);
    recipe.apply(scene, recipe.computeCandles(group));
  };
  addCandles(kCandleUpBase, "candlesUp", theme.candleUp, groups->up);
  addCandles(kCandleDownBase, "candlesDown", theme.candleDown, groups->down);

  SmaRecipeConfig smaCfg;
  smaCfg.layerId = kPriceSeriesLayer;
  smaCfg.transformId = kPriceTransform;
  smaCfg.name = "sma" + std::to_string(series.window());
  std::memcpy(smaCfg.color, theme.smaColor, sizeof(smaCfg.color));
  smaCfg.lineWidth = theme.smaLineWidth;
  SmaRecipe sma(kSmaBase, smaCfg);
  sma.build(scene);
  sma.apply(scene, sma.compute(series));

  auto addVolume = [&](Id base, const char* name, const float* color,
                       const ClassifiedGroup& group) {
    VolumeRecipeConfig cfg;
    cfg.layerId = kVolumeSeriesLayer;
    cfg.transformId = kVolumeTransform;
    cfg.name = name;
    std::memcpy(cfg.color, color, sizeof(cfg.color));
    cfg.barHalfWidth = options.volumeHalfWidth;
    VolumeRecipe recipe(base, cfg);
    recipe.build(scene);
    recipe.apply(scene, recipe.computeVolumeBars(group));
  };
  addVolume(kVolumeUpBase, "volumeUp", theme.candleUp, groups->up);
  addVolume(kVolumeDownBase, "volumeDown", theme.candleDown, groups->down);

  // Symbol and trend annotation, top-left inside the price pane
  float left = clipToPixelX(out.priceRegion.clipXMin, options.width) + 8.0f;
  float top = clipToPixelY(out.priceRegion.clipYMax, options.height) - 8.0f;
  float titleScale = atlas ? options.titleFontSize / static_cast<float>(atlas->glyphPx()) : 0.0f;
  float statusScale = atlas ? options.statusFontSize / static_cast<float>(atlas->glyphPx()) : 0.0f;
  float titleAscent = atlas ? atlas->ascent() * titleScale : options.titleFontSize * 0.8f;
  float titleBaseline = top - titleAscent;
  float titleDescent = atlas ? -atlas->descent() * titleScale : options.titleFontSize * 0.2f;
  float statusAscent = atlas ? atlas->ascent() * statusScale : options.statusFontSize * 0.8f;
  float statusBaseline = titleBaseline - titleDescent - 6.0f - statusAscent;

  out.title = inputs.symbol;
  TextRecipeConfig titleCfg;
  titleCfg.layerId = kOverlayLayer;
  titleCfg.transformId = kPixelTransform;
  titleCfg.name = "title";
  std::memcpy(titleCfg.color, theme.textColor, sizeof(titleCfg.color));
  titleCfg.fontSize = options.titleFontSize;
  TextRecipe title(kTitleBase, titleCfg);
  title.build(scene);
  if (atlas) title.apply(scene, title.layout(*atlas, inputs.symbol, left, titleBaseline));

  if (inputs.trend) {
    const TrendStatus& st = *inputs.trend;
    out.statusText = st.label;

    // Label in the text color, then the status-colored dot one space after it.
    TextRecipeConfig statusCfg = titleCfg;
    statusCfg.name = "trendStatus";
    statusCfg.fontSize = options.statusFontSize;
    TextRecipe status(kStatusBase, statusCfg);
    status.build(scene);

    float labelWidth = static_cast<float>(st.label.size()) * options.statusFontSize * 0.6f;
    float spaceWidth = options.statusFontSize * 0.3f;
    if (atlas) {
      TextLayoutResult run = status.layout(*atlas, st.label, left, statusBaseline);
      labelWidth = run.advanceWidth;
      spaceWidth = measureText(*atlas, " ", options.statusFontSize);
      status.apply(scene, run);
    }

    float radius = options.statusFontSize * 0.4f;
    MarkerRecipeConfig markerCfg;
    markerCfg.layerId = kOverlayLayer;
    markerCfg.transformId = kPixelTransform;
    markerCfg.name = "trendMarker";
    std::memcpy(markerCfg.color, st.color, sizeof(markerCfg.color));
    markerCfg.radius = radius;
    MarkerRecipe marker(kMarkerBase, markerCfg);
    marker.build(scene);
    marker.apply(scene, marker.computeDisc(left + labelWidth + spaceWidth + radius,
                                           statusBaseline + options.statusFontSize * 0.35f));
  }

  return out;
}

} // namespace tc
