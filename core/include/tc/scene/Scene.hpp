#pragma once
#include "tc/scene/Geometry.hpp"
#include "tc/scene/Types.hpp"
#include <map>
#include <vector>

namespace tc {

// Immutable-after-build chart description: Pane -> Layer -> DrawItem, plus the
// buffers, geometries and transforms draw items bind to.
// Enumeration follows ascending id, which is also the draw order.
class Scene {
public:
  bool hasPane(Id id) const;
  bool hasLayer(Id id) const;
  bool hasDrawItem(Id id) const;
  bool hasBuffer(Id id) const;
  bool hasGeometry(Id id) const;
  bool hasTransform(Id id) const;

  const Pane*      getPane(Id id) const;
  const Layer*     getLayer(Id id) const;
  const DrawItem*  getDrawItem(Id id) const;
  const Buffer*    getBuffer(Id id) const;
  const Geometry*  getGeometry(Id id) const;
  const Transform* getTransform(Id id) const;

  DrawItem* getDrawItemMutable(Id id);

  // Create (caller ensures IDs are unique)
  void addPane(Pane p);
  void addLayer(Layer l);
  void addDrawItem(DrawItem d);
  void addBuffer(Buffer b);
  void addGeometry(Geometry g);
  void addTransform(Transform t);

  // Replace a buffer's bytes (creates the buffer if missing).
  void setBufferData(Id bufferId, const void* data, std::uint32_t bytes);
  bool setGeometryVertexCount(Id geometryId, std::uint32_t count);

  std::vector<Id> paneIds() const;
  std::vector<Id> layerIds() const;
  std::vector<Id> drawItemIds() const;
  std::vector<Id> bufferIds() const;

  // Draw items of one layer / layers of one pane, in draw order.
  std::vector<Id> layersOf(Id paneId) const;
  std::vector<Id> drawItemsOf(Id layerId) const;

private:
  std::map<Id, Pane> panes_;
  std::map<Id, Layer> layers_;
  std::map<Id, DrawItem> drawItems_;
  std::map<Id, Buffer> buffers_;
  std::map<Id, Geometry> geometries_;
  std::map<Id, Transform> transforms_;
};

} // namespace tc
