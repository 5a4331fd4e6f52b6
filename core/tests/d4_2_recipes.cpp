// D4.2: Chart recipes: candles, volume, SMA segments, axis geometry and labels

#include "tc/recipe/AxisRecipe.hpp"
#include "tc/recipe/CandleRecipe.hpp"
#include "tc/recipe/MarkerRecipe.hpp"
#include "tc/recipe/SmaRecipe.hpp"
#include "tc/recipe/VolumeRecipe.hpp"
#include "tc/scene/Scene.hpp"
#include "tc/series/CandleClassifier.hpp"
#include "tc/series/SeriesPreparer.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

static tc::Scene sceneWithLayer() {
  tc::Scene scene;
  tc::Pane p;
  p.id = 1;
  scene.addPane(p);
  tc::Layer l;
  l.id = 2;
  l.paneId = 1;
  scene.addLayer(l);
  return scene;
}

static tc::Series smallSeries() {
  std::vector<tc::Bar> bars;
  double opens[]  = {10, 12, 11, 13, 12};
  double closes[] = {12, 11, 13, 12, 14};
  for (int i = 0; i < 5; i++) {
    tc::Bar b;
    b.date = {2024, 6, 3 + i};
    b.open = opens[i];
    b.close = closes[i];
    b.high = 15;
    b.low = 9;
    b.volume = 1000u * static_cast<unsigned>(i + 1);
    bars.push_back(b);
  }
  return tc::prepareSeries(bars, 3, 1.0);
}

int main() {
  tc::Series series = smallSeries();
  tc::CandleGroups groups = tc::classifyCandles(series);

  std::printf("=== CandleRecipe ===\n");
  {
    tc::Scene scene = sceneWithLayer();
    tc::CandleRecipeConfig cfg;
    cfg.layerId = 2;
    cfg.name = "up";
    cfg.color[0] = 0.0f;
    tc::CandleRecipe recipe(100, cfg);
    recipe.build(scene);
    requireTrue(recipe.bufferId() == 100 && recipe.geometryId() == 101 &&
                recipe.drawItemId() == 102, "deterministic ids");

    auto data = recipe.computeCandles(groups.up);
    requireTrue(data.candleCount == 3, "three up candles");
    requireTrue(data.candle6.size() == 18, "6 floats each");
    requireTrue(data.candle6[6] == 2.0f, "second up candle sits at plot index 2");
    requireTrue(data.candle6[7] == 11.0f && data.candle6[10] == 13.0f, "open/close");
    requireTrue(data.candle6[5] == 0.3f, "body half width");

    recipe.apply(scene, data);
    requireTrue(scene.getGeometry(101)->vertexCount == 3, "geometry sized");
    requireTrue(scene.getBuffer(100)->byteLength() == 18 * sizeof(float), "buffer filled");
    const tc::DrawItem* di = scene.getDrawItem(102);
    requireTrue(di->pipeline == "instancedCandle@1", "candle pipeline");
    requireTrue(di->colorUp[0] == 0.0f && di->colorDown[0] == 0.0f, "single group color");
    std::printf("  OK\n");
  }

  std::printf("=== VolumeRecipe ===\n");
  {
    tc::Scene scene = sceneWithLayer();
    tc::VolumeRecipeConfig cfg;
    cfg.layerId = 2;
    tc::VolumeRecipe recipe(130, cfg);
    recipe.build(scene);
    auto data = recipe.computeVolumeBars(groups.down);
    requireTrue(data.barCount == 2, "two down bars");
    requireTrue(data.rect4[0] == 0.5f && data.rect4[2] == 1.5f, "full unit width at x=1");
    requireTrue(data.rect4[1] == 0.0f && data.rect4[3] == 2000.0f, "from zero to volume");
    recipe.apply(scene, data);
    requireTrue(scene.getDrawItem(recipe.drawItemId())->pipeline == "instancedRect@1", "rect");
    std::printf("  OK\n");
  }

  std::printf("=== SmaRecipe ===\n");
  {
    tc::Scene scene = sceneWithLayer();
    tc::SmaRecipeConfig cfg;
    cfg.layerId = 2;
    cfg.lineWidth = 1.5f;
    tc::SmaRecipe recipe(120, cfg);
    recipe.build(scene);
    auto data = recipe.compute(series);
    // averages exist from index 2, so segments 2-3 and 3-4
    requireTrue(data.segmentCount == 2, "undefined positions skipped");
    requireTrue(data.segments[0] == 2.0f && data.segments[2] == 3.0f, "segment x");
    requireTrue(std::fabs(data.segments[1] - 12.0f) < 1e-5f, "mean(12, 11, 13)");
    recipe.apply(scene, data);
    requireTrue(scene.getDrawItem(recipe.drawItemId())->lineWidth == 1.5f, "line width");
    std::printf("  OK\n");
  }

  std::printf("=== MarkerRecipe ===\n");
  {
    tc::Scene scene = sceneWithLayer();
    tc::MarkerRecipeConfig cfg;
    cfg.layerId = 2;
    cfg.segments = 8;
    cfg.radius = 4.0f;
    tc::MarkerRecipe recipe(420, cfg);
    recipe.build(scene);
    auto tris = recipe.computeDisc(10.0f, 20.0f);
    requireTrue(tris.size() == 8 * 6, "8 triangles");
    requireTrue(tris[0] == 10.0f && tris[1] == 20.0f, "fan center");
    requireTrue(std::fabs(tris[2] - 14.0f) < 1e-5f, "rim at radius");
    recipe.apply(scene, tris);
    requireTrue(scene.getGeometry(421)->vertexCount == 24, "24 vertices");
    std::printf("  OK\n");
  }

  std::printf("=== Axis labels ===\n");
  {
    requireTrue(tc::formatPriceLabel(125.0, 25.0) == "125", "integer step");
    requireTrue(tc::formatPriceLabel(12.5, 2.5) == "12.5", "2.5 step");
    requireTrue(tc::formatPriceLabel(-1e-12, 0.5) == "0.0", "no negative zero");
    requireTrue(tc::formatVolumeLabel(950.0) == "950", "plain");
    requireTrue(tc::formatVolumeLabel(12000.0) == "12K", "thousands");
    requireTrue(tc::formatVolumeLabel(2500000.0) == "2.5M", "millions");
    requireTrue(tc::formatVolumeLabel(1.2e9) == "1.2B", "billions");
    std::printf("  OK\n");
  }

  std::printf("=== AxisRecipe geometry ===\n");
  {
    tc::Scene scene = sceneWithLayer();
    tc::AxisRecipeConfig cfg;
    cfg.gridLayerId = 2;
    cfg.labelLayerId = 2;
    cfg.name = "vol";
    cfg.viewW = 400;
    cfg.viewH = 200;
    cfg.region = tc::PaneRegion{-0.5f, 0.5f, -0.5f, 0.5f};
    cfg.valueFormat = tc::AxisValueFormat::Volume;
    cfg.yTargetTicks = 2;
    cfg.showXAxis = true;
    tc::AxisRecipe axis(300, cfg);
    axis.build(scene);

    tc::AxisTickSet ticks = {{0, "Jun"}, {3, "Jul"}, {99, "Aug"}};
    auto data = axis.computeAxisData(nullptr, -1.0, 5.0, 0.0, 5000.0, ticks);
    requireTrue(data.hGridLineCount == data.yTicks.values.size(), "one h-line per y tick");
    requireTrue(data.yLabels.size() == data.yTicks.values.size(), "one label per y tick");
    requireTrue(data.yLabels.back() == "5K", "volume formatted");
    requireTrue(data.vGridLineCount == 2, "out-of-range x tick dropped");
    requireTrue(data.xLabels.size() == 2 && data.xLabels[1] == "Jul", "x labels");
    requireTrue(data.spineLineCount == 1, "bottom spine");
    requireTrue(data.tickCount == data.hGridLineCount + 2, "y marks + x marks");
    requireTrue(data.labelGlyphCount == 0, "no glyphs without an atlas");

    // Spine runs along the pane bottom: y = 0.25 * 200 = 50px, x from 100 to 300px.
    requireTrue(std::fabs(data.spineVerts[0] - 100.0f) < 1e-3f, "spine left");
    requireTrue(std::fabs(data.spineVerts[1] - 50.0f) < 1e-3f, "spine y");
    requireTrue(std::fabs(data.spineVerts[2] - 300.0f) < 1e-3f, "spine right");

    axis.apply(scene, data);
    requireTrue(scene.getGeometry(304)->vertexCount == 2, "v-grid geometry");
    requireTrue(scene.getDrawItem(axis.labelDrawItemId())->pipeline == "textSDF@1", "labels");

    cfg.showXAxis = false;
    tc::AxisRecipe price(400, cfg);
    auto pd = price.computeAxisData(nullptr, -1.0, 5.0, 0.0, 5000.0, ticks);
    requireTrue(pd.xLabels.empty() && pd.spineLineCount == 0, "no x axis on the upper pane");
    requireTrue(pd.vGridLineCount == 2, "but vertical grid lines stay");
    std::printf("  OK\n");
  }

  std::printf("\nD4.2 recipes: ALL PASS\n");
  return 0;
}
