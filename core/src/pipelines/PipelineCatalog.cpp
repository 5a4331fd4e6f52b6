#include "tc/pipelines/PipelineCatalog.hpp"
#include "tc/scene/Scene.hpp"

namespace tc {

PipelineCatalog::PipelineCatalog() {
  auto add = [this](const char* name, VertexFormat fmt) {
    PipelineSpec spec;
    spec.name = name;
    spec.version = 1;
    spec.requiredVertexFormat = fmt;
    specs_.emplace(pipelineKey(spec.name, spec.version), std::move(spec));
  };
  add("triSolid", VertexFormat::Pos2_Clip);
  add("instancedRect", VertexFormat::Rect4);
  add("instancedCandle", VertexFormat::Candle6);
  add("textSDF", VertexFormat::Glyph8);
  add("lineAA", VertexFormat::Rect4);
}

const PipelineSpec* PipelineCatalog::find(const std::string& key) const {
  auto it = specs_.find(key);
  return it == specs_.end() ? nullptr : &it->second;
}

bool validateScene(const Scene& scene, const PipelineCatalog& catalog, std::string& err) {
  for (Id layerId : scene.layerIds()) {
    const Layer* layer = scene.getLayer(layerId);
    if (!scene.hasPane(layer->paneId)) {
      err = "layer " + std::to_string(layerId) + " references missing pane";
      return false;
    }
  }

  for (Id diId : scene.drawItemIds()) {
    const DrawItem* di = scene.getDrawItem(diId);
    std::string who = "drawItem " + std::to_string(diId) + " (" + di->name + ")";
    if (!scene.hasLayer(di->layerId)) {
      err = who + " references missing layer";
      return false;
    }
    const PipelineSpec* spec = catalog.find(di->pipeline);
    if (!spec) {
      err = who + " uses unknown pipeline '" + di->pipeline + "'";
      return false;
    }
    const Geometry* geo = scene.getGeometry(di->geometryId);
    if (!geo) {
      err = who + " references missing geometry";
      return false;
    }
    if (geo->format != spec->requiredVertexFormat) {
      err = who + " needs " + toString(spec->requiredVertexFormat) +
            " geometry, got " + toString(geo->format);
      return false;
    }
    const Buffer* buf = scene.getBuffer(geo->vertexBufferId);
    if (!buf) {
      err = who + " geometry references missing buffer";
      return false;
    }
    std::uint64_t need = static_cast<std::uint64_t>(geo->vertexCount) * strideOf(geo->format);
    if (buf->byteLength() < need) {
      err = who + " buffer too small for vertexCount";
      return false;
    }
    if (di->transformId != 0 && !scene.hasTransform(di->transformId)) {
      err = who + " references missing transform";
      return false;
    }
  }
  return true;
}

} // namespace tc
