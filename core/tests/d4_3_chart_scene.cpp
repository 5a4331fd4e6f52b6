// D4.3: Chart scene composition: panes, ranges, draw items, validation

#include "tc/data/Errors.hpp"
#include "tc/pipelines/PipelineCatalog.hpp"
#include "tc/scene/ChartSceneBuilder.hpp"
#include "tc/series/PreparedChart.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static std::vector<tc::Bar> sampleBars() {
  std::vector<tc::Bar> bars;
  std::int64_t start = tc::toDayNumber({2023, 9, 1});
  for (int i = 0; i < 120; i++) {
    tc::Bar b;
    b.date = tc::fromDayNumber(start + i);
    double base = 100.0 + 5.0 * std::sin(i * 0.2);
    b.open = base;
    b.close = base + ((i % 3 == 0) ? -1.0 : 1.0);
    b.high = base + 2.0;
    b.low = base - 2.0;
    b.volume = 1000000u + 10000u * static_cast<unsigned>(i);
    bars.push_back(b);
  }
  return bars;
}

static tc::ChartSceneInputs inputsFor(const tc::PreparedChart& chart) {
  tc::ChartSceneInputs in;
  in.series = chart.series.get();
  in.groups = &chart.groups;
  in.ticks = &chart.ticks;
  in.trend = chart.trend;
  in.symbol = "TEST";
  return in;
}

int main() {
  using namespace tc::chart_ids;
  tc::PreparedChart chart = tc::prepareChart(sampleBars(), 20, 1.0, tc::darkTheme());
  tc::ChartSceneOptions options;
  options.theme = tc::darkTheme();

  std::printf("=== Structure ===\n");
  {
    tc::ChartScene cs = tc::buildChartScene(inputsFor(chart), options, nullptr);
    const tc::Scene& s = cs.scene;

    requireTrue(cs.width == 1200 && cs.height == 800, "image size");
    requireTrue(s.paneIds() == (std::vector<tc::Id>{kBackgroundPane, kPricePane, kVolumePane,
                                                    kOverlayPane}), "panes in draw order");
    requireTrue(s.getPane(kBackgroundPane)->hasClearColor, "background clears");
    requireTrue(s.layersOf(kPricePane) == (std::vector<tc::Id>{kPriceGridLayer, kPriceSeriesLayer}),
                "grid under series");

    float priceH = cs.priceRegion.clipYMax - cs.priceRegion.clipYMin;
    float volumeH = cs.volumeRegion.clipYMax - cs.volumeRegion.clipYMin;
    requireTrue(std::fabs(priceH / volumeH - 3.0f) < 1e-3f, "price pane 3x volume pane");
    requireTrue(cs.priceRegion.clipYMin > cs.volumeRegion.clipYMax, "price above volume");

    auto series = s.drawItemsOf(kPriceSeriesLayer);
    requireTrue(series.size() == 3, "up candles, down candles, SMA");
    requireTrue(s.getDrawItem(kCandleUpBase + 2)->pipeline == "instancedCandle@1", "candles");
    requireTrue(s.getDrawItem(kSmaBase + 2)->pipeline == "lineAA@1", "sma line");
    requireTrue(s.drawItemsOf(kVolumeSeriesLayer).size() == 2, "volume up/down");

    std::uint32_t candles = s.getGeometry(kCandleUpBase + 1)->vertexCount +
                            s.getGeometry(kCandleDownBase + 1)->vertexCount;
    requireTrue(candles == chart.series->size(), "one candle per bar");
    std::uint32_t volumes = s.getGeometry(kVolumeUpBase + 1)->vertexCount +
                            s.getGeometry(kVolumeDownBase + 1)->vertexCount;
    requireTrue(volumes == chart.series->size(), "one volume bar per bar");
    requireTrue(s.getGeometry(kSmaBase + 1)->vertexCount == chart.series->size() - 20,
                "SMA segments between defined averages");

    const float* up = s.getDrawItem(kVolumeUpBase + 2)->color;
    requireTrue(up[1] == options.theme.candleUp[1], "volume shares the up color");
    std::printf("  OK\n");
  }

  std::printf("=== Ranges ===\n");
  {
    tc::ChartScene cs = tc::buildChartScene(inputsFor(chart), options, nullptr);
    requireTrue(cs.xMin == -1.0 && cs.xMax == static_cast<double>(chart.series->size()),
                "x spans [-1, n]");
    double lo = 1e9, hi = -1e9;
    for (const auto& pb : chart.series->bars()) {
      lo = std::min(lo, pb.bar.low);
      hi = std::max(hi, pb.bar.high);
    }
    requireTrue(cs.priceMin < lo && cs.priceMax > hi, "price range padded");
    requireTrue(cs.volumeMin == 0.0, "volume from zero");
    requireTrue(cs.volumeMax > 1000000.0 + 10000.0 * 119, "volume headroom");
    requireTrue(!cs.priceLabels.empty() && !cs.volumeLabels.empty(), "y labels");
    requireTrue(!cs.xLabels.empty() && cs.xLabels[0] == "Sep", "x labels from month ticks");
    std::printf("  OK\n");
  }

  std::printf("=== Trend annotation ===\n");
  {
    tc::ChartScene cs = tc::buildChartScene(inputsFor(chart), options, nullptr);
    requireTrue(chart.trend.has_value(), "trend present");
    requireTrue(cs.statusText == chart.trend->label, "status text");
    requireTrue(cs.title == "TEST", "title");
    requireTrue(cs.scene.hasDrawItem(kMarkerBase + 2), "indicator dot");
    const tc::DrawItem* dot = cs.scene.getDrawItem(kMarkerBase + 2);
    requireTrue(dot->color[0] == chart.trend->color[0] && dot->color[1] == chart.trend->color[1],
                "dot uses the trend color");

    const tc::DrawItem* label = cs.scene.getDrawItem(kStatusBase + 2);
    for (int c = 0; c < 4; c++) {
      requireTrue(label->color[c] == options.theme.textColor[c], "status label in text color");
    }

    // The dot follows the label: every disc vertex lies right of the label's extent.
    const tc::Buffer* disc = cs.scene.getBuffer(kMarkerBase);
    requireTrue(disc && disc->byteLength() > 0, "disc vertices");
    const float* xy = reinterpret_cast<const float*>(disc->data.data());
    std::size_t floats = disc->byteLength() / sizeof(float);
    float textLeft = tc::clipToPixelX(cs.priceRegion.clipXMin, cs.width) + 8.0f;
    float labelRight = textLeft + static_cast<float>(cs.statusText.size()) *
                                      options.statusFontSize * 0.6f;
    float minX = 1e9f;
    for (std::size_t i = 0; i < floats; i += 2) minX = std::min(minX, xy[i]);
    requireTrue(minX > labelRight, "dot placed after the label");

    tc::ChartSceneInputs noTrend = inputsFor(chart);
    noTrend.trend.reset();
    tc::ChartScene plain = tc::buildChartScene(noTrend, options, nullptr);
    requireTrue(plain.statusText.empty(), "no status text");
    requireTrue(!plain.scene.hasDrawItem(kMarkerBase + 2), "no dot");
    std::printf("  OK\n");
  }

  std::printf("=== Validation ===\n");
  {
    tc::ChartScene cs = tc::buildChartScene(inputsFor(chart), options, nullptr);
    tc::PipelineCatalog catalog;
    std::string err;
    requireTrue(tc::validateScene(cs.scene, catalog, err), err.c_str());

    tc::DrawItem* di = cs.scene.getDrawItemMutable(kSmaBase + 2);
    di->pipeline = "instancedCandle@1";
    requireTrue(!tc::validateScene(cs.scene, catalog, err), "format mismatch rejected");
    requireTrue(err.find("sma") != std::string::npos, "error names the draw item");

    di->pipeline = "nope@9";
    requireTrue(!tc::validateScene(cs.scene, catalog, err), "unknown pipeline rejected");
    std::printf("  OK\n");
  }

  std::printf("=== Empty series ===\n");
  {
    tc::Series empty;
    tc::ChartSceneInputs in;
    in.series = &empty;
    bool threw = false;
    try {
      tc::buildChartScene(in, options, nullptr);
    } catch (const tc::EmptySeriesError&) {
      threw = true;
    }
    requireTrue(threw, "EmptySeriesError");
    std::printf("  OK\n");
  }

  std::printf("\nD4.3 chart_scene: ALL PASS\n");
  return 0;
}
