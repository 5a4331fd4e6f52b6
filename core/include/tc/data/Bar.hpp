#pragma once
#include <cstdint>
#include <string>

namespace tc {

// Calendar date (proleptic Gregorian). month 1..12, day 1..31.
struct Date {
  int year{1970};
  int month{1};
  int day{1};
};

inline bool operator==(const Date& a, const Date& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b) { return !(a == b); }
inline bool operator<(const Date& a, const Date& b) {
  if (a.year != b.year) return a.year < b.year;
  if (a.month != b.month) return a.month < b.month;
  return a.day < b.day;
}
inline bool operator>(const Date& a, const Date& b) { return b < a; }

// Days since 1970-01-01 (negative before the epoch).
std::int64_t toDayNumber(const Date& d);
Date fromDayNumber(std::int64_t days);

// Accepts YYYY-MM-DD, MM/DD/YYYY and YYYYMMDD. Trailing time components
// ("2024-01-02 00:00:00", "2024-01-02T00:00") are ignored.
bool parseDate(const std::string& text, Date& out);

// "YYYY-MM-DD"
std::string formatDate(const Date& d);

// One OHLCV record for a single trading interval.
struct Bar {
  Date date;
  double open{0};
  double high{0};
  double low{0};
  double close{0};
  std::uint64_t volume{0};
  std::uint64_t openInterest{0};
};

} // namespace tc
