#pragma once
#include "tc/data/Bar.hpp"
#include "tc/series/Series.hpp"
#include <vector>

namespace tc {

constexpr int kDefaultSmaWindow = 150;
constexpr double kDefaultLookbackYears = 1.0;
constexpr double kDaysPerYear = 365.0;

// Sort raw bars by date (later duplicates of a date replace earlier ones),
// compute the SMA over the whole history, keep bars with
// date > maxDate - years*365 days and number them 0..n-1.
// Throws DataError on empty input or an empty result, ConfigError on
// window < 1 or years <= 0.
Series prepareSeries(std::vector<Bar> raw,
                     int window = kDefaultSmaWindow,
                     double years = kDefaultLookbackYears);

} // namespace tc
