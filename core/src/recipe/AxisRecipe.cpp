#include "tc/recipe/AxisRecipe.hpp"
#include "tc/layout/PaneLayout.hpp"
#include "tc/scene/Scene.hpp"
#include "tc/text/TextLayout.hpp"

#include <cmath>
#include <cstdio>
#include <cstring>

namespace tc {

std::string formatPriceLabel(double value, double step) {
  // Nice-tick arithmetic can land a hair off zero; keep "-0.00" off the axis.
  if (std::fabs(value) < std::fabs(step) * 1e-6) value = 0.0;
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%.*f", decimalsForStep(step), value);
  return buf;
}

std::string formatVolumeLabel(double value) {
  static const struct { double scale; const char* suffix; } kUnits[] = {
    {1e9, "B"}, {1e6, "M"}, {1e3, "K"},
  };
  char buf[48];
  for (const auto& u : kUnits) {
    if (std::fabs(value) >= u.scale) {
      double v = value / u.scale;
      // one decimal unless it is zero
      if (std::fabs(v - std::round(v)) < 0.05) {
        std::snprintf(buf, sizeof(buf), "%.0f%s", std::round(v), u.suffix);
      } else {
        std::snprintf(buf, sizeof(buf), "%.1f%s", v, u.suffix);
      }
      return buf;
    }
  }
  std::snprintf(buf, sizeof(buf), "%.0f", value);
  return buf;
}

AxisRecipe::AxisRecipe(Id idBase, const AxisRecipeConfig& config)
  : Recipe(idBase), config_(config) {}

void AxisRecipe::build(Scene& scene) const {
  const std::string& n = config_.name;
  addBoundItem(scene, 0, config_.gridLayerId, n + "_hGrid",
               "lineAA@1", VertexFormat::Rect4, config_.dataTransformId);
  addBoundItem(scene, 3, config_.gridLayerId, n + "_vGrid",
               "lineAA@1", VertexFormat::Rect4, config_.dataTransformId);
  addBoundItem(scene, 6, config_.labelLayerId, n + "_ticks",
               "lineAA@1", VertexFormat::Rect4, config_.pixelTransformId);
  addBoundItem(scene, 9, config_.labelLayerId, n + "_spine",
               "lineAA@1", VertexFormat::Rect4, config_.pixelTransformId);
  addBoundItem(scene, 12, config_.labelLayerId, n + "_labels",
               "textSDF@1", VertexFormat::Glyph8, config_.pixelTransformId);

  for (Id id : {hGridDrawItemId(), vGridDrawItemId()}) {
    DrawItem* di = scene.getDrawItemMutable(id);
    std::memcpy(di->color, config_.gridColor, sizeof(di->color));
    di->lineWidth = config_.gridLineWidth;
  }
  for (Id id : {tickDrawItemId(), spineDrawItemId()}) {
    DrawItem* di = scene.getDrawItemMutable(id);
    std::memcpy(di->color, config_.tickColor, sizeof(di->color));
    di->lineWidth = config_.tickLineWidth;
  }
  DrawItem* labels = scene.getDrawItemMutable(labelDrawItemId());
  std::memcpy(labels->color, config_.labelColor, sizeof(labels->color));
}

float AxisRecipe::dataToPixelX(double x, double xMin, double xMax) const {
  const PaneRegion& r = config_.region;
  double t = (xMax > xMin) ? (x - xMin) / (xMax - xMin) : 0.0;
  float clipX = r.clipXMin + static_cast<float>(t) * (r.clipXMax - r.clipXMin);
  return clipToPixelX(clipX, config_.viewW);
}

float AxisRecipe::dataToPixelY(double y, double yMin, double yMax) const {
  const PaneRegion& r = config_.region;
  double t = (yMax > yMin) ? (y - yMin) / (yMax - yMin) : 0.0;
  float clipY = r.clipYMin + static_cast<float>(t) * (r.clipYMax - r.clipYMin);
  return clipToPixelY(clipY, config_.viewH);
}

static void pushSegment(std::vector<float>& out, float x0, float y0, float x1, float y1) {
  out.push_back(x0); out.push_back(y0);
  out.push_back(x1); out.push_back(y1);
}

AxisRecipe::AxisData AxisRecipe::computeAxisData(const GlyphAtlas* atlas,
                                                 double xMin, double xMax,
                                                 double yMin, double yMax,
                                                 const AxisTickSet& xTicks) const {
  AxisData data;
  TextLayoutResult text;

  const PaneRegion& r = config_.region;
  float paneLeftPx = clipToPixelX(r.clipXMin, config_.viewW);
  float paneRightPx = clipToPixelX(r.clipXMax, config_.viewW);
  float paneBottomPx = clipToPixelY(r.clipYMin, config_.viewH);

  // Y axis: grid, marks and labels at nice ticks
  data.yTicks = computeNiceTicks(yMin, yMax, config_.yTargetTicks);
  for (double val : data.yTicks.values) {
    pushSegment(data.hGridVerts, static_cast<float>(xMin), static_cast<float>(val),
                static_cast<float>(xMax), static_cast<float>(val));
    data.hGridLineCount++;

    float py = dataToPixelY(val, yMin, yMax);
    pushSegment(data.tickVerts, paneLeftPx - config_.tickLengthPx, py, paneLeftPx, py);
    data.tickCount++;

    std::string label = config_.valueFormat == AxisValueFormat::Volume
                          ? formatVolumeLabel(val)
                          : formatPriceLabel(val, data.yTicks.step);
    data.yLabels.push_back(label);
    if (atlas) {
      appendTextLines(text, *atlas, label, paneLeftPx - config_.labelGapPx,
                      py - config_.fontSize * 0.35f, config_.fontSize, TextAlign::Right);
    }
  }

  // X axis: vertical grid at every month tick
  for (const AxisTick& tick : xTicks) {
    double x = static_cast<double>(tick.plotIndex);
    if (x < xMin || x > xMax) continue;
    pushSegment(data.vGridVerts, static_cast<float>(x), static_cast<float>(yMin),
                static_cast<float>(x), static_cast<float>(yMax));
    data.vGridLineCount++;

    if (!config_.showXAxis) continue;

    float px = dataToPixelX(x, xMin, xMax);
    pushSegment(data.tickVerts, px, paneBottomPx - config_.tickLengthPx, px, paneBottomPx);
    data.tickCount++;

    data.xLabels.push_back(tick.label);
    if (atlas) {
      float scale = config_.fontSize / static_cast<float>(atlas->glyphPx());
      float baseline = paneBottomPx - config_.tickLengthPx - config_.labelGapPx * 0.5f -
                       atlas->ascent() * scale;
      appendTextLines(text, *atlas, tick.label, px, baseline, config_.fontSize,
                      TextAlign::Center);
    }
  }

  if (config_.showXAxis) {
    pushSegment(data.spineVerts, paneLeftPx, paneBottomPx, paneRightPx, paneBottomPx);
    data.spineLineCount++;
  }

  data.labelInstances = std::move(text.glyphInstances);
  data.labelGlyphCount = static_cast<std::uint32_t>(text.glyphCount);
  return data;
}

void AxisRecipe::apply(Scene& scene, const AxisData& data) const {
  setVertexData(scene, 0, VertexFormat::Rect4, data.hGridVerts);
  setVertexData(scene, 3, VertexFormat::Rect4, data.vGridVerts);
  setVertexData(scene, 6, VertexFormat::Rect4, data.tickVerts);
  setVertexData(scene, 9, VertexFormat::Rect4, data.spineVerts);
  setVertexData(scene, 12, VertexFormat::Glyph8, data.labelInstances);
}

} // namespace tc
