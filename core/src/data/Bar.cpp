#include "tc/data/Bar.hpp"
#include <cctype>
#include <cstdio>

namespace tc {

// Howard Hinnant's days_from_civil / civil_from_days.
std::int64_t toDayNumber(const Date& d) {
  std::int64_t y = d.year - (d.month <= 2 ? 1 : 0);
  std::int64_t era = (y >= 0 ? y : y - 399) / 400;
  std::int64_t yoe = y - era * 400;
  std::int64_t m = d.month;
  std::int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d.day - 1;
  std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + doe - 719468;
}

Date fromDayNumber(std::int64_t days) {
  days += 719468;
  std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  std::int64_t doe = days - era * 146097;
  std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  std::int64_t y = yoe + era * 400;
  std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  std::int64_t mp = (5 * doy + 2) / 153;
  std::int64_t d = doy - (153 * mp + 2) / 5 + 1;
  std::int64_t m = mp < 10 ? mp + 3 : mp - 9;
  Date out;
  out.year = static_cast<int>(y + (m <= 2 ? 1 : 0));
  out.month = static_cast<int>(m);
  out.day = static_cast<int>(d);
  return out;
}

static bool isValidDate(const Date& d) {
  if (d.month < 1 || d.month > 12 || d.day < 1) return false;
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int maxDay = kDays[d.month - 1];
  bool leap = (d.year % 4 == 0 && d.year % 100 != 0) || d.year % 400 == 0;
  if (d.month == 2 && leap) maxDay = 29;
  return d.day <= maxDay;
}

// Reads exactly `n` digits starting at `pos`.
static bool readDigits(const std::string& s, std::size_t pos, int n, int& out) {
  if (pos + static_cast<std::size_t>(n) > s.size()) return false;
  int v = 0;
  for (int i = 0; i < n; i++) {
    char c = s[pos + static_cast<std::size_t>(i)];
    if (c < '0' || c > '9') return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  return true;
}

// Reads 1 or 2 digits; returns number consumed (0 on failure).
static std::size_t readShort(const std::string& s, std::size_t pos, int& out) {
  std::size_t n = 0;
  int v = 0;
  while (pos + n < s.size() && n < 2 &&
         std::isdigit(static_cast<unsigned char>(s[pos + n]))) {
    v = v * 10 + (s[pos + n] - '0');
    n++;
  }
  out = v;
  return n;
}

bool parseDate(const std::string& raw, Date& out) {
  // Trim whitespace and surrounding quotes.
  std::size_t b = 0, e = raw.size();
  while (b < e && (std::isspace(static_cast<unsigned char>(raw[b])) || raw[b] == '"')) b++;
  while (e > b && (std::isspace(static_cast<unsigned char>(raw[e - 1])) || raw[e - 1] == '"')) e--;
  std::string s = raw.substr(b, e - b);

  // Drop a trailing time part.
  std::size_t cut = s.find_first_of(" T");
  if (cut != std::string::npos) s = s.substr(0, cut);
  if (s.empty()) return false;

  Date d;
  if (s.find('-') != std::string::npos) {
    // YYYY-MM-DD
    if (s.size() != 10 || s[4] != '-' || s[7] != '-') return false;
    if (!readDigits(s, 0, 4, d.year) || !readDigits(s, 5, 2, d.month) ||
        !readDigits(s, 8, 2, d.day))
      return false;
  } else if (s.find('/') != std::string::npos) {
    // MM/DD/YYYY (month and day may be a single digit)
    std::size_t pos = 0;
    std::size_t n = readShort(s, pos, d.month);
    if (n == 0 || pos + n >= s.size() || s[pos + n] != '/') return false;
    pos += n + 1;
    n = readShort(s, pos, d.day);
    if (n == 0 || pos + n >= s.size() || s[pos + n] != '/') return false;
    pos += n + 1;
    if (s.size() - pos != 4 || !readDigits(s, pos, 4, d.year)) return false;
  } else {
    // YYYYMMDD
    if (s.size() != 8) return false;
    if (!readDigits(s, 0, 4, d.year) || !readDigits(s, 4, 2, d.month) ||
        !readDigits(s, 6, 2, d.day))
      return false;
  }

  if (!isValidDate(d)) return false;
  out = d;
  return true;
}

std::string formatDate(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
  return buf;
}

} // namespace tc
