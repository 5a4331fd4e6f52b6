// D2.6: Nice y-axis ticks and the chart preparation pipeline

#include "tc/math/NiceTicks.hpp"
#include "tc/series/PreparedChart.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <utility>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static void requireNear(double a, double b, double tol, const char* msg) {
  if (std::fabs(a - b) > tol) {
    std::fprintf(stderr, "ASSERT FAIL: %s (got %.9f, expected %.9f)\n", msg, a, b);
    std::exit(1);
  }
}

int main() {
  std::printf("=== Nice steps ===\n");
  {
    auto t = tc::computeNiceTicks(0.0, 100.0, 5);
    requireNear(t.step, 20.0, 1e-12, "0..100 / 5 -> 20");
    requireTrue(t.values.size() == 6, "0, 20, ..., 100");
    requireNear(t.values.back(), 100.0, 1e-9, "upper end included");

    t = tc::computeNiceTicks(0.5, 9.7, 5);
    requireNear(t.step, 2.0, 1e-12, "step 2");
    requireTrue(t.values.size() == 4, "2, 4, 6, 8 inside the range");
    requireNear(t.values.front(), 2.0, 1e-12, "first inside");

    t = tc::computeNiceTicks(10.0, 22.0, 5);
    requireNear(t.step, 2.5, 1e-12, "2.5 step");

    t = tc::computeNiceTicks(3.0, 3.0, 5);
    requireTrue(t.values.size() == 1 && t.values[0] == 3.0, "degenerate range");

    for (double v : tc::computeNiceTicks(123.4, 987.6, 6).values) {
      requireTrue(v >= 123.4 && v <= 987.6, "values stay inside [lo, hi]");
    }
    std::printf("  OK\n");
  }

  std::printf("=== Decimals ===\n");
  {
    requireTrue(tc::decimalsForStep(20.0) == 0, "integer step");
    requireTrue(tc::decimalsForStep(2.5) == 1, "2.5");
    requireTrue(tc::decimalsForStep(0.25) == 2, "0.25");
    requireTrue(tc::decimalsForStep(0.1) == 1, "0.1");
    std::printf("  OK\n");
  }

  std::printf("=== prepareChart ===\n");
  {
    std::vector<tc::Bar> bars;
    for (std::int64_t d = tc::toDayNumber({2023, 11, 1}); d <= tc::toDayNumber({2024, 2, 15}); d++) {
      tc::Bar b;
      b.date = tc::fromDayNumber(d);
      b.open = 100.0 + static_cast<double>(d % 7);
      b.close = 100.0 + static_cast<double>(d % 5);
      b.high = 110.0;
      b.low = 90.0;
      b.volume = 1000;
      bars.push_back(b);
    }
    auto chart = tc::prepareChart(bars, 10, 1.0, tc::darkTheme());
    requireTrue(chart.series && chart.series->size() == bars.size(), "all bars in window");
    requireTrue(chart.groups.up.size() + chart.groups.down.size() == bars.size(), "groups cover");
    requireTrue(!chart.ticks.empty() && chart.ticks[0].plotIndex == 0, "Nov 1 starts the axis");
    requireTrue(chart.trend.has_value(), "trend available");

    // Moving the result keeps the group views valid.
    tc::PreparedChart moved = std::move(chart);
    requireTrue(moved.groups.up.size() == 0 || moved.groups.up[0].bar.high == 110.0,
                "groups still reach the series");

    auto again = tc::prepareChart(bars, 10, 1.0, tc::darkTheme());
    requireTrue(again.groups.up.indices() == moved.groups.up.indices(), "re-run is identical");
    requireTrue(again.ticks.size() == moved.ticks.size(), "same ticks");
    std::printf("  OK\n");
  }

  std::printf("\nD2.6 nice_ticks: ALL PASS\n");
  return 0;
}
