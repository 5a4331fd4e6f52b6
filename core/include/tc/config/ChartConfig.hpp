#pragma once
#include "tc/series/SeriesPreparer.hpp"
#include "tc/style/Theme.hpp"
#include <string>

namespace tc {

#ifndef TC_DEFAULT_FONT_PATH
#define TC_DEFAULT_FONT_PATH "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"
#endif

// Serializable rendering and ingestion settings.
struct ChartConfig {
  std::string version{"1.0"};

  int smaWindow{kDefaultSmaWindow};
  double years{kDefaultLookbackYears};

  // Output image in pixels
  int width{1200};
  int height{800};

  std::string fontPath{TC_DEFAULT_FONT_PATH};

  // Remote source
  std::string remoteHost{"query1.finance.yahoo.com"};
  int remoteLookbackDays{730};
  int httpTimeoutSec{20};

  Theme theme{darkTheme()};
};

// Serialize ChartConfig to a JSON string.
std::string serializeChartConfig(const ChartConfig& config);

// Apply the members present in a JSON document on top of `out`.
// Throws ConfigError on malformed JSON, wrong member types or out-of-range values.
void deserializeChartConfig(const std::string& json, ChartConfig& out);

// Read a JSON file and apply it to `out`. Throws ConfigError if unreadable.
void loadChartConfigFile(const std::string& path, ChartConfig& out);

} // namespace tc
