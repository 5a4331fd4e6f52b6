#include "tc/series/PreparedChart.hpp"
#include "tc/series/SeriesPreparer.hpp"
#include <utility>

namespace tc {

PreparedChart prepareChart(std::vector<Bar> bars, int window, double years, const Theme& theme) {
  PreparedChart chart;
  chart.series = std::make_shared<const Series>(prepareSeries(std::move(bars), window, years));
  chart.groups = classifyCandles(*chart.series);
  chart.trend = classifyTrend(*chart.series, theme);
  chart.ticks = computeMonthTicks(chart.series->dates());
  return chart;
}

} // namespace tc
