#pragma once
#include "tc/config/ChartConfig.hpp"
#include "tc/export/ChartSnapshot.hpp"
#include "tc/scene/ChartSceneBuilder.hpp"

namespace tc {

// Build the chart scene and rasterize it offscreen.
// Throws EmptySeriesError for an empty series and RenderError when the font,
// GL context, shaders or scene validation fail.
ChartImage renderChart(const ChartSceneInputs& inputs, const ChartConfig& config);

} // namespace tc
