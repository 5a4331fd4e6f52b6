#include "tc/series/SeriesPreparer.hpp"
#include "tc/data/Errors.hpp"
#include "tc/math/Sma.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace tc {

Series prepareSeries(std::vector<Bar> raw, int window, double years) {
  if (raw.empty()) throw DataError("no bars to prepare");
  if (window < 1) throw ConfigError("moving-average window must be at least 1, got " +
                                    std::to_string(window));
  if (!(years > 0.0) || !std::isfinite(years)) {
    throw ConfigError("lookback years must be a positive number");
  }

  std::stable_sort(raw.begin(), raw.end(),
                   [](const Bar& a, const Bar& b) { return a.date < b.date; });

  // Collapse repeated dates; the row read last wins.
  std::vector<Bar> bars;
  bars.reserve(raw.size());
  for (auto& b : raw) {
    if (!bars.empty() && bars.back().date == b.date) {
      bars.back() = b;
    } else {
      bars.push_back(b);
    }
  }

  std::vector<double> closes(bars.size());
  for (std::size_t i = 0; i < bars.size(); i++) closes[i] = bars[i].close;
  auto sma = computeSma(closes.data(), static_cast<int>(closes.size()), window);

  double cutoff = static_cast<double>(toDayNumber(bars.back().date)) - years * kDaysPerYear;

  std::vector<PreparedBar> kept;
  for (std::size_t i = 0; i < bars.size(); i++) {
    if (static_cast<double>(toDayNumber(bars[i].date)) > cutoff) {
      PreparedBar pb;
      pb.bar = bars[i];
      pb.movingAverage = sma[i];
      pb.plotIndex = kept.size();
      kept.push_back(pb);
    }
  }
  if (kept.empty()) throw DataError("no bars inside the lookback window");

  return Series(std::move(kept), window);
}

} // namespace tc
