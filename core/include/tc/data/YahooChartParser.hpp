#pragma once
#include "tc/data/Bar.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

// Parse a Yahoo Finance v8 chart payload into daily bars.
// Rows with a null price or volume are skipped. Dates are exchange-local
// (timestamp + meta.gmtoffset). Throws IngestionError on malformed JSON or
// an API error object.
std::vector<Bar> parseYahooChart(const std::string& json, const std::string& ticker);

// Request target for the chart endpoint, e.g.
// "/v8/finance/chart/TQQQ?period1=...&period2=...&interval=1d&events=history".
std::string yahooChartTarget(const std::string& ticker,
                             std::int64_t period1, std::int64_t period2);

} // namespace tc
