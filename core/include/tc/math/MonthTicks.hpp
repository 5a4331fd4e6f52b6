#pragma once
#include "tc/data/Bar.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace tc {

struct AxisTick {
  std::size_t plotIndex;
  std::string label;     // may contain '\n' (month over year)
};

using AxisTickSet = std::vector<AxisTick>;

// A tick is placed wherever the month changes between consecutive dates.
// When the first boundary is missing or lies beyond this position, index 0
// gets a tick too.
constexpr std::size_t kLeadingTickReach = 20;

// Month-boundary ticks for an ordered date sequence (one entry per plot index).
AxisTickSet computeMonthTicks(const std::vector<Date>& dates);

// "Jan\n2024" when the tick is January and either the first bar or the
// previous bar belongs to a different year; "Mar" otherwise.
std::string formatMonthTick(const std::vector<Date>& dates, std::size_t index);

} // namespace tc
