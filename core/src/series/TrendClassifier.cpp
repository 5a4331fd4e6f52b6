#include "tc/series/TrendClassifier.hpp"
#include <cstring>

namespace tc {

const char* toString(TrendState s) {
  switch (s) {
    case TrendState::Below: return "Below";
    case TrendState::On: return "On";
    case TrendState::Above: return "Above";
    default: return "unknown";
  }
}

std::optional<TrendStatus> classifyTrend(double close, std::optional<double> movingAverage,
                                         int window, const Theme& theme) {
  if (!movingAverage || !(*movingAverage > 0.0)) return std::nullopt;

  TrendStatus st;
  st.diff = (close - *movingAverage) / *movingAverage;

  const float* color;
  if (st.diff < -kTrendTolerance) {
    st.state = TrendState::Below;
    color = theme.candleDown;
  } else if (st.diff > kTrendTolerance) {
    st.state = TrendState::Above;
    color = theme.candleUp;
  } else {
    st.state = TrendState::On;
    color = theme.onSmaColor;
  }
  std::memcpy(st.color, color, sizeof(st.color));
  st.label = std::string(toString(st.state)) + " (" + std::to_string(window) + ") SMA";
  return st;
}

std::optional<TrendStatus> classifyTrend(const Series& series, const Theme& theme) {
  if (series.empty()) return std::nullopt;
  const PreparedBar& last = series.back();
  return classifyTrend(last.bar.close, last.movingAverage, series.window(), theme);
}

} // namespace tc
