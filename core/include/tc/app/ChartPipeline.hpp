#pragma once
#include "tc/config/ChartConfig.hpp"
#include "tc/data/BarSource.hpp"
#include "tc/series/TrendClassifier.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace tc {

struct ChartRequest {
  std::string identifier;      // file path or ticker
  std::string outputPath;      // empty: outputPathFor(identifier)
  ChartConfig config;
};

struct ChartResult {
  std::string outputPath;
  std::size_t barCount{0};     // bars in the plotted window
  std::optional<TrendStatus> trend;
};

// load -> prepare -> classify -> label -> render -> save.
// The image is written only after it is fully composed; any failure throws
// (IngestionError, DataError, EmptySeriesError, ConfigError, RenderError)
// and leaves no artifact.
ChartResult runChartPipeline(const ChartRequest& request, BarSource& source);

} // namespace tc
