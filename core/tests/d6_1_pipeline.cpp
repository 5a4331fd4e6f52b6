// D6.1: End-to-end: source selection, load -> prepare -> render -> save

#include "tc/app/ChartPipeline.hpp"
#include "tc/app/SourceSelector.hpp"
#include "tc/data/CsvFileSource.hpp"
#include "tc/data/Errors.hpp"
#include "tc/export/ChartSnapshot.hpp"
#include "tc/gl/OsMesaContext.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool fileExists(const std::string& path) {
  std::ifstream f(path);
  return static_cast<bool>(f);
}

static std::vector<std::uint8_t> readFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(f),
                                   std::istreambuf_iterator<char>());
}

// Daily rows, newest first, over roughly eighteen months.
static void writeSampleCsv(const std::string& path) {
  std::ofstream f(path);
  f << "\"Date\",\"Time\",\"Open\",\"High\",\"Low\",\"Close\",\"Vol\",\"OI\"\n";
  std::int64_t start = tc::toDayNumber({2022, 7, 1});
  for (int i = 540; i >= 0; i--) {
    tc::Date d = tc::fromDayNumber(start + i);
    double base = 30.0 + i * 0.04 + ((i / 7) % 3);
    double open = (i % 3 == 0) ? base + 0.4 : base - 0.4;
    double close = (i % 3 == 0) ? base - 0.4 : base + 0.4;
    char line[160];
    std::snprintf(line, sizeof(line), "%02d/%02d/%04d,0,%.2f,%.2f,%.2f,%.2f,%d,0\n",
                  d.month, d.day, d.year, open, base + 1.0, base - 1.0, close,
                  100000 + (i % 50) * 1000);
    f << line;
  }
}

int main() {
  const std::string csv = "d6_1_sample.csv";
  const std::string emptyCsv = "d6_1_empty.csv";
  writeSampleCsv(csv);
  {
    std::ofstream f(emptyCsv);
    f << "Date,Time,Open,High,Low,Close,Vol,OI\n";
  }

  std::printf("=== Source selection ===\n");
  {
    tc::RemoteBarSourceConfig remote;
    auto local = tc::selectBarSource(csv, remote);
    requireTrue(local->describe() == csv, "existing file -> CSV source");
    auto net = tc::selectBarSource("d6_1_no_such_file.txt", remote);
    requireTrue(net->describe() == "remote:D6_1_NO_SUCH_FILE", "missing file -> remote ticker");
    std::printf("  OK\n");
  }

  std::printf("=== Empty input leaves no artifact ===\n");
  {
    tc::ChartRequest req;
    req.identifier = emptyCsv;
    tc::CsvFileSource source(emptyCsv);
    std::string out = tc::outputPathFor(emptyCsv);
    std::remove(out.c_str());
    bool threw = false;
    try {
      tc::runChartPipeline(req, source);
    } catch (const tc::DataError&) {
      threw = true;
    }
    requireTrue(threw, "DataError on an empty series");
    requireTrue(!fileExists(out), "no image written");
    std::printf("  OK\n");
  }

  std::printf("=== Invalid lookback leaves no artifact ===\n");
  {
    tc::ChartRequest req;
    req.identifier = csv;
    req.config.years = -2.0;
    tc::CsvFileSource source(csv);
    bool threw = false;
    try {
      tc::runChartPipeline(req, source);
    } catch (const tc::ConfigError&) {
      threw = true;
    }
    requireTrue(threw && !fileExists(tc::outputPathFor(csv)), "ConfigError, no image");
    std::printf("  OK\n");
  }

#ifndef FONT_PATH
  std::printf("D6.1 pipeline: SKIPPED render (no FONT_PATH)\n");
#else
  {
    tc::OsMesaContext probe;
    if (!probe.init(16, 16)) {
      std::printf("D6.1 pipeline: SKIPPED render (no OSMesa)\n");
      std::remove(csv.c_str());
      std::remove(emptyCsv.c_str());
      return 0;
    }
  }

  std::printf("=== Full run ===\n");
  {
    tc::ChartRequest req;
    req.identifier = csv;
    req.config.fontPath = FONT_PATH;
    req.config.width = 600;
    req.config.height = 400;
    req.config.smaWindow = 50;

    tc::CsvFileSource source(csv);
    tc::ChartResult result = tc::runChartPipeline(req, source);
    requireTrue(result.outputPath == "d6_1_sample_chart.png", "derived output name");
    requireTrue(result.barCount == 365, "one year of daily bars");
    requireTrue(result.trend.has_value(), "trend status");

    auto first = readFile(result.outputPath);
    int w = 0, h = 0;
    requireTrue(tc::readPngSize(first, w, h) && w == 600 && h == 400, "PNG of the requested size");
    requireTrue(!fileExists(result.outputPath + ".tmp"), "no temporary left");

    // Re-running on identical input yields the identical image.
    tc::CsvFileSource again(csv);
    tc::runChartPipeline(req, again);
    requireTrue(readFile(result.outputPath) == first, "idempotent");
    std::remove(result.outputPath.c_str());
    std::printf("  OK\n");
  }
#endif

  std::remove(csv.c_str());
  std::remove(emptyCsv.c_str());
  std::printf("\nD6.1 pipeline: ALL PASS\n");
  return 0;
}
