#pragma once
#include <optional>
#include <vector>

namespace tc {

// Simple Moving Average over a trailing window.
// output[0..period-2] are empty (not enough data).
// output[i] for i >= period-1 is the mean of input[i-period+1 .. i].
std::vector<std::optional<double>> computeSma(const double* input, int count, int period);

} // namespace tc
