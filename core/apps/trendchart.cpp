// trendchart: render a candlestick + volume chart with an SMA trend overlay
// from a local OHLCV file or, when no such file exists, a downloaded series.
//
// Usage: trendchart <data_file> [years] [--config <file.json>]

#include "tc/app/ChartPipeline.hpp"
#include "tc/app/SourceSelector.hpp"
#include "tc/config/ChartConfig.hpp"
#include "tc/data/Errors.hpp"
#include "tc/data/Identifier.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>

namespace {

void printUsage() {
  std::fprintf(stderr, "Usage: trendchart <data_file> [years] [--config <file.json>]\n");
}

double parseYears(const std::string& text) {
  errno = 0;
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE ||
      !std::isfinite(v) || v <= 0.0) {
    throw tc::ConfigError("years must be a positive number, got '" + text + "'");
  }
  return v;
}

} // namespace

int main(int argc, char** argv) {
  std::string identifier;
  std::string yearsArg;
  std::string configPath;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        printUsage();
        return tc::kExitUsage;
      }
      configPath = argv[++i];
    } else if (identifier.empty()) {
      identifier = arg;
    } else if (yearsArg.empty()) {
      yearsArg = arg;
    } else {
      printUsage();
      return tc::kExitUsage;
    }
  }
  if (identifier.empty()) {
    printUsage();
    return tc::kExitUsage;
  }

  try {
    tc::ChartRequest request;
    request.identifier = identifier;
    if (!configPath.empty()) tc::loadChartConfigFile(configPath, request.config);
    if (!yearsArg.empty()) request.config.years = parseYears(yearsArg);

    tc::RemoteBarSourceConfig remote;
    remote.host = request.config.remoteHost;
    remote.lookbackDays = request.config.remoteLookbackDays;
    remote.timeoutSec = request.config.httpTimeoutSec;

    auto source = tc::selectBarSource(identifier, remote);
    tc::ChartResult result = tc::runChartPipeline(request, *source);
    if (result.trend) {
      std::printf("%s: %s (%+.2f%%)\n", tc::symbolFromIdentifier(identifier).c_str(),
                  result.trend->label.c_str(), result.trend->diff * 100.0);
    }
    return 0;
  } catch (const std::exception& e) {
    std::fprintf(stderr, "Error: %s\n", e.what());
    return tc::exitCodeFor(e);
  }
}
