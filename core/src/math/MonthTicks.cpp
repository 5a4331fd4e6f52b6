#include "tc/math/MonthTicks.hpp"
#include <ctime>

namespace tc {

static std::string strftimeDate(const Date& d, const char* fmt) {
  std::tm tm{};
  tm.tm_year = d.year - 1900;
  tm.tm_mon = d.month - 1;
  tm.tm_mday = d.day;
  char buf[32];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

std::string formatMonthTick(const std::vector<Date>& dates, std::size_t index) {
  const Date& d = dates[index];
  bool yearRollover = index == 0 || dates[index - 1].year != d.year;
  if (d.month == 1 && yearRollover) return strftimeDate(d, "%b\n%Y");
  return strftimeDate(d, "%b");
}

AxisTickSet computeMonthTicks(const std::vector<Date>& dates) {
  AxisTickSet ticks;
  if (dates.empty()) return ticks;

  std::vector<std::size_t> positions;
  for (std::size_t i = 1; i < dates.size(); i++) {
    if (dates[i].month != dates[i - 1].month) positions.push_back(i);
  }
  if (positions.empty() || positions.front() > kLeadingTickReach) {
    positions.insert(positions.begin(), 0);
  }

  ticks.reserve(positions.size());
  for (std::size_t idx : positions) {
    ticks.push_back({idx, formatMonthTick(dates, idx)});
  }
  return ticks;
}

} // namespace tc
