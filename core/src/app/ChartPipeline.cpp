#include "tc/app/ChartPipeline.hpp"
#include "tc/data/Errors.hpp"
#include "tc/data/Identifier.hpp"
#include "tc/render/ChartRenderer.hpp"
#include "tc/series/PreparedChart.hpp"
#include <cstdio>
#include <utility>

namespace tc {

ChartResult runChartPipeline(const ChartRequest& request, BarSource& source) {
  std::vector<Bar> bars = source.load();
  if (bars.empty()) {
    throw DataError("no bars loaded from " + source.describe());
  }

  const ChartConfig& config = request.config;
  PreparedChart prepared = prepareChart(std::move(bars), config.smaWindow, config.years,
                                        config.theme);

  ChartSceneInputs inputs;
  inputs.series = prepared.series.get();
  inputs.groups = &prepared.groups;
  inputs.ticks = &prepared.ticks;
  inputs.trend = prepared.trend;
  inputs.symbol = symbolFromIdentifier(request.identifier);

  ChartImage image = renderChart(inputs, config);

  ChartResult result;
  result.outputPath = request.outputPath.empty() ? outputPathFor(request.identifier)
                                                 : request.outputPath;
  saveChartImage(image, result.outputPath);
  result.barCount = prepared.series->size();
  result.trend = prepared.trend;

  std::printf("Chart saved to %s\n", result.outputPath.c_str());
  return result;
}

} // namespace tc
