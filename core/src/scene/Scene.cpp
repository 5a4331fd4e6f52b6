#include "tc/scene/Scene.hpp"
#include <cstring>
#include <utility>

namespace tc {

bool Scene::hasPane(Id id) const      { return panes_.find(id) != panes_.end(); }
bool Scene::hasLayer(Id id) const     { return layers_.find(id) != layers_.end(); }
bool Scene::hasDrawItem(Id id) const  { return drawItems_.find(id) != drawItems_.end(); }
bool Scene::hasBuffer(Id id) const    { return buffers_.find(id) != buffers_.end(); }
bool Scene::hasGeometry(Id id) const  { return geometries_.find(id) != geometries_.end(); }
bool Scene::hasTransform(Id id) const { return transforms_.find(id) != transforms_.end(); }

template <typename T>
static const T* findIn(const std::map<Id, T>& m, Id id) {
  auto it = m.find(id);
  return it == m.end() ? nullptr : &it->second;
}

const Pane* Scene::getPane(Id id) const           { return findIn(panes_, id); }
const Layer* Scene::getLayer(Id id) const         { return findIn(layers_, id); }
const DrawItem* Scene::getDrawItem(Id id) const   { return findIn(drawItems_, id); }
const Buffer* Scene::getBuffer(Id id) const       { return findIn(buffers_, id); }
const Geometry* Scene::getGeometry(Id id) const   { return findIn(geometries_, id); }
const Transform* Scene::getTransform(Id id) const { return findIn(transforms_, id); }

DrawItem* Scene::getDrawItemMutable(Id id) {
  auto it = drawItems_.find(id);
  return it == drawItems_.end() ? nullptr : &it->second;
}

void Scene::addPane(Pane p)           { panes_[p.id] = std::move(p); }
void Scene::addLayer(Layer l)         { layers_[l.id] = std::move(l); }
void Scene::addDrawItem(DrawItem d)   { drawItems_[d.id] = std::move(d); }
void Scene::addBuffer(Buffer b)       { buffers_[b.id] = std::move(b); }
void Scene::addGeometry(Geometry g)   { geometries_[g.id] = std::move(g); }
void Scene::addTransform(Transform t) { transforms_[t.id] = t; }

void Scene::setBufferData(Id bufferId, const void* data, std::uint32_t bytes) {
  Buffer& b = buffers_[bufferId];
  b.id = bufferId;
  b.data.resize(bytes);
  if (bytes > 0) std::memcpy(b.data.data(), data, bytes);
}

bool Scene::setGeometryVertexCount(Id geometryId, std::uint32_t count) {
  auto it = geometries_.find(geometryId);
  if (it == geometries_.end()) return false;
  it->second.vertexCount = count;
  return true;
}

template <typename T>
static std::vector<Id> keysOf(const std::map<Id, T>& m) {
  std::vector<Id> out;
  out.reserve(m.size());
  for (auto& kv : m) out.push_back(kv.first);
  return out;
}

std::vector<Id> Scene::paneIds() const     { return keysOf(panes_); }
std::vector<Id> Scene::layerIds() const    { return keysOf(layers_); }
std::vector<Id> Scene::drawItemIds() const { return keysOf(drawItems_); }
std::vector<Id> Scene::bufferIds() const   { return keysOf(buffers_); }

std::vector<Id> Scene::layersOf(Id paneId) const {
  std::vector<Id> out;
  for (auto& kv : layers_) {
    if (kv.second.paneId == paneId) out.push_back(kv.first);
  }
  return out;
}

std::vector<Id> Scene::drawItemsOf(Id layerId) const {
  std::vector<Id> out;
  for (auto& kv : drawItems_) {
    if (kv.second.layerId == layerId) out.push_back(kv.first);
  }
  return out;
}

} // namespace tc
