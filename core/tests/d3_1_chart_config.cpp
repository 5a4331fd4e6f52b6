// D3.1: ChartConfig JSON: defaults, overrides, validation, theme colors

#include "tc/config/ChartConfig.hpp"
#include "tc/data/Errors.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static bool near(float a, float b) { return std::fabs(a - b) < 1.0f / 255.0f; }

static bool rejects(const std::string& json) {
  tc::ChartConfig cfg;
  try {
    tc::deserializeChartConfig(json, cfg);
  } catch (const tc::ConfigError&) {
    return true;
  }
  return false;
}

int main() {
  std::printf("=== Defaults ===\n");
  {
    tc::ChartConfig cfg;
    requireTrue(cfg.smaWindow == 150 && cfg.years == 1.0, "window and years");
    requireTrue(cfg.width == 1200 && cfg.height == 800, "image size");
    requireTrue(cfg.remoteLookbackDays == 730, "two years of remote data");
    requireTrue(cfg.theme.name == "Dark", "dark theme");
    requireTrue(near(cfg.theme.backgroundColor[0], 15.0f / 255.0f), "background #0f0f0f");
    std::printf("  OK\n");
  }

  std::printf("=== Hex colors ===\n");
  {
    float c[4];
    requireTrue(tc::parseHexColor("#15ff25", c), "parse rgb");
    requireTrue(near(c[0], 0x15 / 255.0f) && near(c[1], 1.0f) && near(c[3], 1.0f), "rgb values");
    requireTrue(tc::parseHexColor("#FF000080", c) && near(c[3], 128.0f / 255.0f), "rgba");
    requireTrue(!tc::parseHexColor("15ff25", c), "missing #");
    requireTrue(!tc::parseHexColor("#12345", c), "wrong length");
    requireTrue(!tc::parseHexColor("#zz0000", c), "bad digit");

    float rgb[4] = {1.0f, 0.0f, 0.0f, 1.0f};
    requireTrue(tc::formatHexColor(rgb) == "#ff0000", "format opaque");
    float rgba[4] = {0.0f, 0.0f, 1.0f, 0.5f};
    requireTrue(tc::formatHexColor(rgba) == "#0000ff80", "format translucent");
    std::printf("  OK\n");
  }

  std::printf("=== Partial override ===\n");
  {
    tc::ChartConfig cfg;
    tc::deserializeChartConfig(R"({
      "smaWindow": 50,
      "years": 2.5,
      "remote": {"timeoutSec": 5},
      "theme": {"sma": "#0000ff", "gridLineWidth": 1}
    })", cfg);
    requireTrue(cfg.smaWindow == 50, "window overridden");
    requireTrue(cfg.years == 2.5, "years overridden");
    requireTrue(cfg.httpTimeoutSec == 5, "timeout overridden");
    requireTrue(cfg.remoteLookbackDays == 730, "untouched member keeps default");
    requireTrue(near(cfg.theme.smaColor[2], 1.0f) && near(cfg.theme.smaColor[0], 0.0f), "sma color");
    requireTrue(cfg.theme.gridLineWidth == 1.0f, "grid width");
    requireTrue(near(cfg.theme.candleUp[1], 1.0f), "other colors kept");
    std::printf("  OK\n");
  }

  std::printf("=== Serialize then load ===\n");
  {
    tc::ChartConfig cfg;
    cfg.smaWindow = 42;
    cfg.width = 640;
    cfg.remoteHost = "example.test";
    cfg.theme.onSmaColor[1] = 0.0f;
    std::string json = tc::serializeChartConfig(cfg);
    requireTrue(json.find("\"smaWindow\": 42") != std::string::npos, "pretty JSON");

    tc::ChartConfig loaded;
    tc::deserializeChartConfig(json, loaded);
    requireTrue(loaded.smaWindow == 42 && loaded.width == 640, "numbers");
    requireTrue(loaded.remoteHost == "example.test", "remote host");
    requireTrue(near(loaded.theme.onSmaColor[1], 0.0f) && near(loaded.theme.onSmaColor[0], 1.0f),
                "accent color");
    requireTrue(near(loaded.theme.gridColor[3], 0.5f), "grid alpha survives");
    std::printf("  OK\n");
  }

  std::printf("=== Rejected documents ===\n");
  {
    requireTrue(rejects("{"), "parse error");
    requireTrue(rejects("[1,2]"), "not an object");
    requireTrue(rejects(R"({"smaWindow": 0})"), "window < 1");
    requireTrue(rejects(R"({"smaWindow": "150"})"), "window as string");
    requireTrue(rejects(R"({"years": -1})"), "negative years");
    requireTrue(rejects(R"({"width": 10})"), "tiny image");
    requireTrue(rejects(R"({"remote": 3})"), "remote not an object");
    requireTrue(rejects(R"({"theme": {"candleUp": "green"}})"), "bad color");

    tc::ChartConfig cfg;
    cfg.smaWindow = 77;
    bool threw = false;
    try {
      tc::deserializeChartConfig(R"({"smaWindow": 10, "width": 1})", cfg);
    } catch (const tc::ConfigError&) {
      threw = true;
    }
    requireTrue(threw && cfg.smaWindow == 77, "failed load leaves config unchanged");
    std::printf("  OK\n");
  }

  std::printf("=== Config file ===\n");
  {
    const std::string path = "d3_1_config.json";
    {
      std::ofstream f(path);
      f << R"({"height": 600})";
    }
    tc::ChartConfig cfg;
    tc::loadChartConfigFile(path, cfg);
    requireTrue(cfg.height == 600, "loaded from file");
    std::remove(path.c_str());

    bool threw = false;
    try {
      tc::loadChartConfigFile("d3_1_missing.json", cfg);
    } catch (const tc::ConfigError& e) {
      threw = std::string(e.what()).find("d3_1_missing.json") != std::string::npos;
    }
    requireTrue(threw, "missing file names the path");
    std::printf("  OK\n");
  }

  std::printf("\nD3.1 chart_config: ALL PASS\n");
  return 0;
}
