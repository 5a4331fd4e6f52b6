#include "tc/data/RemoteBarSource.hpp"
#include "tc/data/Errors.hpp"
#include "tc/data/HttpsClient.hpp"
#include "tc/data/YahooChartParser.hpp"

#include <chrono>
#include <cstdio>
#include <utility>

namespace tc {

RemoteBarSource::RemoteBarSource(std::string ticker, const RemoteBarSourceConfig& config)
  : ticker_(std::move(ticker)), config_(config) {}

std::vector<Bar> RemoteBarSource::load() {
  if (ticker_.empty()) throw IngestionError("no ticker symbol to download");

  auto now = std::chrono::system_clock::now();
  std::int64_t end = std::chrono::duration_cast<std::chrono::seconds>(
                         now.time_since_epoch()).count();
  std::int64_t start = end - static_cast<std::int64_t>(config_.lookbackDays) * 86400;

  std::printf("Downloading %s data from %s to %s...\n", ticker_.c_str(),
              formatDate(fromDayNumber(start / 86400)).c_str(),
              formatDate(fromDayNumber(end / 86400)).c_str());

  HttpsResponse res;
  try {
    res = httpsGet(config_.host, yahooChartTarget(ticker_, start, end), config_.timeoutSec);
  } catch (const std::exception& e) {
    throw IngestionError(std::string("download failed: ") + e.what());
  }

  // The chart endpoint reports unknown symbols as 404 with an error body.
  if (res.status >= 400 && res.status != 404) {
    throw IngestionError("download of " + ticker_ + " failed with HTTP status " +
                         std::to_string(res.status));
  }

  std::vector<Bar> bars = parseYahooChart(res.body, ticker_);
  if (bars.empty()) {
    throw IngestionError("no data found for ticker " + ticker_);
  }

  std::printf("Successfully downloaded %zu rows of data for %s\n", bars.size(), ticker_.c_str());
  return bars;
}

} // namespace tc
