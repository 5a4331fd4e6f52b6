#pragma once
#include "tc/data/Bar.hpp"
#include "tc/math/MonthTicks.hpp"
#include "tc/series/CandleClassifier.hpp"
#include "tc/series/Series.hpp"
#include "tc/series/TrendClassifier.hpp"
#include "tc/style/Theme.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace tc {

// Everything derived from one bar list. The series is held by pointer so the
// groups' views stay valid when a PreparedChart is moved.
struct PreparedChart {
  std::shared_ptr<const Series> series;
  CandleGroups groups;
  AxisTickSet ticks;
  std::optional<TrendStatus> trend;
};

// prepareSeries -> classifyCandles + classifyTrend -> computeMonthTicks.
// Throws what prepareSeries throws.
PreparedChart prepareChart(std::vector<Bar> bars, int window, double years, const Theme& theme);

} // namespace tc
