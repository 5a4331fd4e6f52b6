// D1.2: CsvFileSource: header matching, row parsing, ingestion errors

#include "tc/data/CsvFileSource.hpp"
#include "tc/data/Errors.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

// Parse `text` and return the IngestionError message ("" if it parsed).
static std::string parseError(const std::string& text) {
  std::istringstream in(text);
  try {
    tc::CsvFileSource::parse(in, "mem.csv");
  } catch (const tc::IngestionError& e) {
    return e.what();
  }
  return "";
}

int main() {
  std::printf("=== Quoted header, unsorted rows ===\n");
  {
    std::istringstream in(
        "\"Date\",\"Time\",\"Open\",\"High\",\"Low\",\"Close\",\"Vol\",\"OI\"\n"
        "01/03/2024,00:00,10.5,11,10,10.8,12000,5\n"
        "01/02/2024,00:00,10,10.6,9.5,10.4,9000,0\n"
        "\n");
    auto bars = tc::CsvFileSource::parse(in, "mem.csv");
    requireTrue(bars.size() == 2, "two rows, blank line skipped");
    requireTrue(bars[0].date == (tc::Date{2024, 1, 3}), "file order kept");
    requireTrue(bars[0].open == 10.5 && bars[0].high == 11.0, "open/high");
    requireTrue(bars[0].low == 10.0 && bars[0].close == 10.8, "low/close");
    requireTrue(bars[0].volume == 12000 && bars[0].openInterest == 5, "vol/oi");
    requireTrue(bars[1].date == (tc::Date{2024, 1, 2}), "second row date");
    std::printf("  OK\n");
  }

  std::printf("=== Case-insensitive names, optional columns ===\n");
  {
    std::istringstream in(
        " date , open,HIGH,low,Close,Volume\r\n"
        "2024-02-01,1,2,0.5,1.5,100\r\n");
    auto bars = tc::CsvFileSource::parse(in, "mem.csv");
    requireTrue(bars.size() == 1, "one row");
    requireTrue(bars[0].close == 1.5 && bars[0].volume == 100, "values");
    requireTrue(bars[0].openInterest == 0, "no OI column -> 0");
    std::printf("  OK\n");
  }

  std::printf("=== Byte order mark before the header ===\n");
  {
    std::istringstream in(
        "\xEF\xBB\xBF\"Date\",\"Time\",\"Open\",\"High\",\"Low\",\"Close\",\"Vol\",\"OI\"\n"
        "01/02/2024,00:00,10,10.6,9.5,10.4,9000,0\n");
    auto bars = tc::CsvFileSource::parse(in, "bom.csv");
    requireTrue(bars.size() == 1, "BOM does not hide the Date column");
    requireTrue(bars[0].date == (tc::Date{2024, 1, 2}) && bars[0].close == 10.4, "row values");
    std::printf("  OK\n");
  }

  std::printf("=== Errors ===\n");
  {
    requireTrue(parseError("").find("header") != std::string::npos, "empty input");
    requireTrue(parseError("Date,Open,High,Low,Vol\n").find("Close") != std::string::npos,
                "missing Close column");

    std::string bad = parseError("Date,Open,High,Low,Close,Vol\n"
                                 "2024-01-02,1,2,0.5,1.5,100\n"
                                 "2024-01-03,1,x,0.5,1.5,100\n");
    requireTrue(bad.find("mem.csv:3") != std::string::npos, "error names line 3");
    requireTrue(bad.find("High") != std::string::npos, "error names field");

    requireTrue(!parseError("Date,Open,High,Low,Close,Vol\nnot-a-date,1,2,0.5,1.5,1\n").empty(),
                "bad date");
    requireTrue(!parseError("Date,Open,High,Low,Close,Vol\n2024-01-02,1,2\n").empty(),
                "short row");
    requireTrue(!parseError("Date,Open,High,Low,Close,Vol\n2024-01-02,1,2,0.5,1.5,-3\n").empty(),
                "negative volume");
    std::printf("  OK\n");
  }

  std::printf("=== File source ===\n");
  {
    const std::string path = "d1_2_bars.csv";
    {
      std::ofstream f(path);
      f << "Date,Time,Open,High,Low,Close,Vol,OI\n20240105,0,3,4,2,3.5,700,0\n";
    }
    tc::CsvFileSource src(path);
    requireTrue(src.describe() == path, "describe is the path");
    auto bars = src.load();
    requireTrue(bars.size() == 1 && bars[0].date == (tc::Date{2024, 1, 5}), "loaded");
    std::remove(path.c_str());

    tc::CsvFileSource missing("d1_2_does_not_exist.csv");
    bool threw = false;
    try {
      missing.load();
    } catch (const tc::IngestionError& e) {
      threw = std::string(e.what()).find("d1_2_does_not_exist.csv") != std::string::npos;
    }
    requireTrue(threw, "missing file -> IngestionError naming it");
    std::printf("  OK\n");
  }

  std::printf("\nD1.2 csv_source: ALL PASS\n");
  return 0;
}
