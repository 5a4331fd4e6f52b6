// D2.2: SeriesPreparer: ordering, trailing-window cutoff, dense plot indices

#include "tc/data/Errors.hpp"
#include "tc/series/SeriesPreparer.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
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

static tc::Bar makeBar(const tc::Date& d, double close) {
  tc::Bar b;
  b.date = d;
  b.open = close - 0.5;
  b.high = close + 1.0;
  b.low = close - 1.0;
  b.close = close;
  b.volume = 1000;
  return b;
}

// One bar per calendar day over [from, to].
static std::vector<tc::Bar> dailyBars(const tc::Date& from, const tc::Date& to) {
  std::vector<tc::Bar> bars;
  for (std::int64_t d = tc::toDayNumber(from); d <= tc::toDayNumber(to); d++) {
    bars.push_back(makeBar(tc::fromDayNumber(d), 100.0 + static_cast<double>(d % 17)));
  }
  return bars;
}

template <typename E, typename F>
static bool throwsAs(F fn) {
  try {
    fn();
  } catch (const E&) {
    return true;
  }
  return false;
}

int main() {
  std::printf("=== One-year cutoff on daily bars ===\n");
  {
    auto bars = dailyBars({2022, 1, 1}, {2024, 1, 1});
    auto series = tc::prepareSeries(bars, 150, 1.0);

    // cutoff = 2024-01-01 - 365 days = 2023-01-01, kept strictly after it
    requireTrue(series.size() == 365, "365 bars after 2023-01-01");
    requireTrue(series[0].bar.date == (tc::Date{2023, 1, 2}), "first kept bar");
    requireTrue(series.back().bar.date == (tc::Date{2024, 1, 1}), "last kept bar");
    requireTrue(series.window() == 150, "window recorded");
    for (std::size_t i = 0; i < series.size(); i++) {
      requireTrue(series[i].plotIndex == i, "plotIndex == position");
      requireTrue(series[i].movingAverage.has_value(), "history warms the average up");
    }
    std::printf("  OK\n");
  }

  std::printf("=== Average uses history before the cutoff ===\n");
  {
    auto bars = dailyBars({2022, 1, 1}, {2024, 1, 1});
    auto series = tc::prepareSeries(bars, 150, 1.0);
    // The first kept bar is position 366 of the full history.
    double sum = 0;
    for (std::size_t k = 366 - 149; k <= 366; k++) sum += bars[k].close;
    requireNear(*series[0].movingAverage, sum / 150.0, 1e-9, "SMA over full history");
    std::printf("  OK\n");
  }

  std::printf("=== Unsorted input with gaps ===\n");
  {
    std::vector<tc::Bar> bars = {
      makeBar({2024, 1, 10}, 13), makeBar({2024, 1, 2}, 10), makeBar({2024, 1, 8}, 12),
      makeBar({2024, 1, 3}, 11),
    };
    auto series = tc::prepareSeries(bars, 2, 1.0);
    requireTrue(series.size() == 4, "all kept");
    requireTrue(series[0].bar.date == (tc::Date{2024, 1, 2}), "sorted first");
    requireTrue(series[3].bar.date == (tc::Date{2024, 1, 10}), "sorted last");
    requireTrue(series[3].plotIndex == 3, "gaps closed");
    requireTrue(!series[0].movingAverage, "no average before the window fills");
    requireNear(*series[1].movingAverage, 10.5, 1e-12, "mean of 10, 11");
    requireNear(*series[3].movingAverage, 12.5, 1e-12, "mean of 12, 13");

    auto dates = series.dates();
    requireTrue(dates.size() == 4 && dates[2] == (tc::Date{2024, 1, 8}), "dates()");
    std::printf("  OK\n");
  }

  std::printf("=== Duplicate dates ===\n");
  {
    std::vector<tc::Bar> bars = {
      makeBar({2024, 1, 2}, 10), makeBar({2024, 1, 3}, 11), makeBar({2024, 1, 2}, 20),
    };
    auto series = tc::prepareSeries(bars, 1, 1.0);
    requireTrue(series.size() == 2, "duplicate collapsed");
    requireTrue(series[0].bar.close == 20.0, "later row wins");
    std::printf("  OK\n");
  }

  std::printf("=== Fractional years ===\n");
  {
    auto bars = dailyBars({2023, 1, 1}, {2024, 1, 1});
    auto series = tc::prepareSeries(bars, 5, 0.5);
    // cutoff = maxDay - 182.5, so days maxDay-182 .. maxDay stay
    requireTrue(series.size() == 183, "half a year");
    std::printf("  OK\n");
  }

  std::printf("=== Errors ===\n");
  {
    requireTrue(throwsAs<tc::DataError>([] { tc::prepareSeries({}, 150, 1.0); }),
                "empty input -> DataError");
    auto one = dailyBars({2024, 1, 1}, {2024, 1, 1});
    requireTrue(throwsAs<tc::ConfigError>([&] { tc::prepareSeries(one, 0, 1.0); }),
                "window 0 -> ConfigError");
    requireTrue(throwsAs<tc::ConfigError>([&] { tc::prepareSeries(one, 150, 0.0); }),
                "years 0 -> ConfigError");
    requireTrue(throwsAs<tc::ConfigError>([&] { tc::prepareSeries(one, 150, -1.0); }),
                "negative years -> ConfigError");

    auto s = tc::prepareSeries(one, 150, 0.001);
    requireTrue(s.size() == 1, "the last bar always survives its own cutoff");
    std::printf("  OK\n");
  }

  std::printf("=== Deterministic ===\n");
  {
    auto bars = dailyBars({2023, 3, 1}, {2024, 2, 1});
    auto a = tc::prepareSeries(bars, 20, 0.75);
    auto b = tc::prepareSeries(bars, 20, 0.75);
    requireTrue(a.size() == b.size(), "same size");
    for (std::size_t i = 0; i < a.size(); i++) {
      requireTrue(a[i].bar.date == b[i].bar.date, "same dates");
      requireTrue(a[i].movingAverage == b[i].movingAverage, "same averages");
    }
    std::printf("  OK\n");
  }

  std::printf("\nD2.2 series_preparer: ALL PASS\n");
  return 0;
}
