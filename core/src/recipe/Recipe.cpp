#include "tc/recipe/Recipe.hpp"
#include "tc/scene/Scene.hpp"

namespace tc {

void Recipe::addBoundItem(Scene& scene, std::uint32_t slot, Id layerId, const std::string& name,
                          const char* pipeline, VertexFormat format, Id transformId) const {
  Buffer buf;
  buf.id = rid(slot);
  scene.addBuffer(buf);

  Geometry geo;
  geo.id = rid(slot + 1);
  geo.vertexBufferId = buf.id;
  geo.format = format;
  geo.vertexCount = 0;
  scene.addGeometry(geo);

  DrawItem di;
  di.id = rid(slot + 2);
  di.layerId = layerId;
  di.name = name;
  di.pipeline = pipeline;
  di.geometryId = geo.id;
  di.transformId = transformId;
  scene.addDrawItem(di);
}

void Recipe::setVertexData(Scene& scene, std::uint32_t slot, VertexFormat format,
                           const std::vector<float>& data) const {
  std::uint32_t bytes = static_cast<std::uint32_t>(data.size() * sizeof(float));
  scene.setBufferData(rid(slot), data.data(), bytes);
  scene.setGeometryVertexCount(rid(slot + 1), bytes / strideOf(format));
}

} // namespace tc
