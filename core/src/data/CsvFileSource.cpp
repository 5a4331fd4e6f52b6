#include "tc/data/CsvFileSource.hpp"
#include "tc/data/Errors.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace tc {

namespace {

std::string trimField(const std::string& s) {
  std::size_t b = 0, e = s.size();
  while (b < e && (std::isspace(static_cast<unsigned char>(s[b])) || s[b] == '"')) b++;
  while (e > b && (std::isspace(static_cast<unsigned char>(s[e - 1])) || s[e - 1] == '"')) e--;
  return s.substr(b, e - b);
}

std::string lower(std::string s) {
  for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

// Split one CSV line; commas inside double quotes are kept.
std::vector<std::string> splitCsv(const std::string& line) {
  std::vector<std::string> out;
  std::string cur;
  bool quoted = false;
  for (char c : line) {
    if (c == '"') {
      quoted = !quoted;
      cur.push_back(c);
    } else if (c == ',' && !quoted) {
      out.push_back(trimField(cur));
      cur.clear();
    } else if (c != '\r') {
      cur.push_back(c);
    }
  }
  out.push_back(trimField(cur));
  return out;
}

bool parseNumber(const std::string& s, double& out) {
  if (s.empty()) return false;
  char* end = nullptr;
  double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0' || !std::isfinite(v)) return false;
  out = v;
  return true;
}

int findColumn(const std::vector<std::string>& header, const char* name) {
  for (std::size_t i = 0; i < header.size(); i++) {
    if (lower(header[i]) == name) return static_cast<int>(i);
  }
  return -1;
}

} // anonymous namespace

CsvFileSource::CsvFileSource(std::string path) : path_(std::move(path)) {}

std::vector<Bar> CsvFileSource::load() {
  std::ifstream f(path_);
  if (!f) throw IngestionError("cannot open data file '" + path_ + "'");
  return parse(f, path_);
}

std::vector<Bar> CsvFileSource::parse(std::istream& in, const std::string& origin) {
  std::string line;
  if (!std::getline(in, line)) {
    throw IngestionError(origin + ": missing header row");
  }
  // UTF-8 byte order mark written by some spreadsheet exports
  if (line.compare(0, 3, "\xEF\xBB\xBF") == 0) line.erase(0, 3);

  auto header = splitCsv(line);
  int colDate  = findColumn(header, "date");
  int colOpen  = findColumn(header, "open");
  int colHigh  = findColumn(header, "high");
  int colLow   = findColumn(header, "low");
  int colClose = findColumn(header, "close");
  int colVol   = findColumn(header, "vol");
  if (colVol < 0) colVol = findColumn(header, "volume");
  int colOi    = findColumn(header, "oi");

  const char* missing = nullptr;
  if (colDate < 0) missing = "Date";
  else if (colOpen < 0) missing = "Open";
  else if (colHigh < 0) missing = "High";
  else if (colLow < 0) missing = "Low";
  else if (colClose < 0) missing = "Close";
  else if (colVol < 0) missing = "Vol";
  if (missing) {
    throw IngestionError(origin + ": missing column '" + missing + "'");
  }

  std::vector<Bar> bars;
  std::size_t lineNo = 1;
  while (std::getline(in, line)) {
    lineNo++;
    if (trimField(line).empty()) continue;

    auto fields = splitCsv(line);
    auto fail = [&](const std::string& what) {
      throw IngestionError(origin + ":" + std::to_string(lineNo) + ": " + what);
    };
    if (static_cast<int>(fields.size()) <= colDate || static_cast<int>(fields.size()) <= colOpen ||
        static_cast<int>(fields.size()) <= colHigh || static_cast<int>(fields.size()) <= colLow ||
        static_cast<int>(fields.size()) <= colClose || static_cast<int>(fields.size()) <= colVol) {
      fail("too few columns");
    }
    auto field = [&](int col) -> const std::string& {
      return fields[static_cast<std::size_t>(col)];
    };

    Bar b;
    if (!parseDate(field(colDate), b.date)) fail("bad date '" + field(colDate) + "'");

    double vol = 0, oi = 0;
    if (!parseNumber(field(colOpen), b.open))   fail("bad Open value");
    if (!parseNumber(field(colHigh), b.high))   fail("bad High value");
    if (!parseNumber(field(colLow), b.low))     fail("bad Low value");
    if (!parseNumber(field(colClose), b.close)) fail("bad Close value");
    if (!parseNumber(field(colVol), vol) || vol < 0) fail("bad Vol value");
    if (colOi >= 0 && colOi < static_cast<int>(fields.size()) &&
        !fields[static_cast<std::size_t>(colOi)].empty()) {
      if (!parseNumber(fields[static_cast<std::size_t>(colOi)], oi) || oi < 0)
        fail("bad OI value");
    }
    b.volume = static_cast<std::uint64_t>(std::llround(vol));
    b.openInterest = static_cast<std::uint64_t>(std::llround(oi));
    bars.push_back(b);
  }

  return bars;
}

} // namespace tc
