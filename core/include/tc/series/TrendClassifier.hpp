#pragma once
#include "tc/series/Series.hpp"
#include "tc/style/Theme.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace tc {

enum class TrendState : std::uint8_t { Below, On, Above };

const char* toString(TrendState s);

// Relative distance from the average inside which the close counts as "on" it.
constexpr double kTrendTolerance = 0.005;

struct TrendStatus {
  TrendState state{TrendState::On};
  std::string label;                 // "Above (150) SMA"
  float color[4] = {1, 1, 1, 1};
  double diff{0};                    // (close - ma) / ma
};

// No status when the average is absent or not positive.
std::optional<TrendStatus> classifyTrend(double close, std::optional<double> movingAverage,
                                         int window, const Theme& theme);

// Classifies the last bar of the series.
std::optional<TrendStatus> classifyTrend(const Series& series, const Theme& theme);

} // namespace tc
