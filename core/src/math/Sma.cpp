#include "tc/math/Sma.hpp"
#include <cmath>

namespace tc {

namespace {

// Running sum with Neumaier compensation, so the window mean survives large
// level changes (e.g. a split-adjusted series falling by orders of magnitude).
struct CompensatedSum {
  double sum{0.0};
  double carry{0.0};

  void add(double x) {
    double t = sum + x;
    if (std::fabs(sum) >= std::fabs(x)) {
      carry += (sum - t) + x;
    } else {
      carry += (x - t) + sum;
    }
    sum = t;
  }

  double value() const { return sum + carry; }
};

} // anonymous namespace

std::vector<std::optional<double>> computeSma(const double* input, int count, int period) {
  std::vector<std::optional<double>> output(count > 0 ? static_cast<std::size_t>(count) : 0);
  if (count <= 0 || period <= 0 || period > count) return output;

  // Seed with the first full window, then slide.
  CompensatedSum window;
  for (int i = 0; i < period; i++) {
    window.add(input[i]);
  }
  output[static_cast<std::size_t>(period - 1)] = window.value() / static_cast<double>(period);

  for (int i = period; i < count; i++) {
    window.add(input[i]);
    window.add(-input[i - period]);
    output[static_cast<std::size_t>(i)] = window.value() / static_cast<double>(period);
  }
  return output;
}

} // namespace tc
