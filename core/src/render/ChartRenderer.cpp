#include "tc/render/ChartRenderer.hpp"
#include "tc/data/Errors.hpp"
#include "tc/gl/GpuBufferManager.hpp"
#include "tc/gl/OsMesaContext.hpp"
#include "tc/gl/Renderer.hpp"
#include "tc/pipelines/PipelineCatalog.hpp"
#include "tc/text/GlyphAtlas.hpp"
#include <cstring>

namespace tc {

// Raw alpha reads crisper than SDF at axis label sizes.
static constexpr std::uint32_t kAtlasGlyphPx = 32;

ChartImage renderChart(const ChartSceneInputs& inputs, const ChartConfig& config) {
  if (!inputs.series || inputs.series->empty()) {
    throw EmptySeriesError("nothing to render: the prepared series is empty");
  }

  GlyphAtlas atlas;
  atlas.setGlyphPx(kAtlasGlyphPx);
  atlas.setUseSdf(false);
  if (!atlas.loadFontFile(config.fontPath)) {
    throw RenderError("cannot load font '" + config.fontPath + "'");
  }
  atlas.ensureAscii();

  ChartSceneOptions options;
  options.width = config.width;
  options.height = config.height;
  options.theme = config.theme;
  ChartScene chart = buildChartScene(inputs, options, &atlas);

  PipelineCatalog catalog;
  std::string err;
  if (!validateScene(chart.scene, catalog, err)) {
    throw RenderError("invalid chart scene: " + err);
  }

  OsMesaContext ctx;
  if (!ctx.init(chart.width, chart.height)) {
    throw RenderError("cannot create offscreen GL context");
  }

  Renderer renderer;
  if (!renderer.init()) {
    throw RenderError("shader compilation failed");
  }
  renderer.setGlyphAtlas(&atlas);

  GpuBufferManager gpuBufs;
  Stats stats = renderer.render(chart.scene, gpuBufs, chart.width, chart.height,
                                chart.clearColor);
  ctx.finish();
  if (stats.drawCalls == 0) {
    throw RenderError("chart scene produced no draw calls");
  }

  std::vector<std::uint8_t> bottomUp = ctx.readPixels();
  const std::size_t rowBytes = static_cast<std::size_t>(chart.width) * 4;
  if (bottomUp.size() != rowBytes * static_cast<std::size_t>(chart.height)) {
    throw RenderError("framebuffer readback failed");
  }

  ChartImage image;
  image.width = chart.width;
  image.height = chart.height;
  image.rgba.resize(bottomUp.size());
  for (int row = 0; row < chart.height; row++) {
    std::memcpy(&image.rgba[static_cast<std::size_t>(row) * rowBytes],
                &bottomUp[static_cast<std::size_t>(chart.height - 1 - row) * rowBytes],
                rowBytes);
  }
  return image;
}

} // namespace tc
