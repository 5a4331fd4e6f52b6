#pragma once
#include <vector>

namespace tc {

struct TickSet {
  double min, max, step;
  std::vector<double> values;
};

// Compute "nice" tick values covering [lo, hi].
// Snaps step to {1, 2, 2.5, 5, 10} x 10^n, then generates values inside the range.
TickSet computeNiceTicks(double lo, double hi, int targetCount = 5);

// Number of decimals needed to print values on a grid of the given step.
int decimalsForStep(double step);

} // namespace tc
