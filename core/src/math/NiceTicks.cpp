#include "tc/math/NiceTicks.hpp"
#include <cmath>

namespace tc {

TickSet computeNiceTicks(double lo, double hi, int targetCount) {
  TickSet result;
  if (targetCount < 1) targetCount = 1;
  if (!(hi > lo)) {
    result.min = lo;
    result.max = hi;
    result.step = 1.0;
    result.values.push_back(lo);
    return result;
  }

  double range = hi - lo;
  double rawStep = range / static_cast<double>(targetCount);

  // Snap to nice step: {1, 2, 2.5, 5, 10} x 10^n
  double mag = std::pow(10.0, std::floor(std::log10(rawStep)));
  double residual = rawStep / mag;

  double niceStep;
  if (residual <= 1.0)       niceStep = 1.0 * mag;
  else if (residual <= 2.0)  niceStep = 2.0 * mag;
  else if (residual <= 2.5)  niceStep = 2.5 * mag;
  else if (residual <= 5.0)  niceStep = 5.0 * mag;
  else                       niceStep = 10.0 * mag;

  result.step = niceStep;
  result.min = std::floor(lo / niceStep) * niceStep;
  result.max = std::ceil(hi / niceStep) * niceStep;

  // Only ticks that fall inside the visible range; integer stepping avoids drift.
  long first = static_cast<long>(std::ceil(lo / niceStep - 1e-9));
  long last = static_cast<long>(std::floor(hi / niceStep + 1e-9));
  for (long k = first; k <= last; k++) {
    result.values.push_back(static_cast<double>(k) * niceStep);
  }

  return result;
}

int decimalsForStep(double step) {
  if (!(step > 0.0)) return 0;
  int decimals = 0;
  double scaled = step;
  while (decimals < 8 && std::fabs(scaled - std::round(scaled)) > 1e-6 * std::fmax(1.0, scaled)) {
    scaled *= 10.0;
    decimals++;
  }
  return decimals;
}

} // namespace tc
