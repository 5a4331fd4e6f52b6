#pragma once
#include "tc/scene/Geometry.hpp"
#include "tc/scene/Types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

class Scene;

// Base class for all recipes. A recipe translates a declarative description
// into scene resources using deterministic ID allocation (idBase + offset).
// build() creates the resources with empty buffers; each recipe's compute
// step produces vertex data that apply() writes into those buffers.
class Recipe {
public:
  explicit Recipe(Id idBase) : idBase_(idBase) {}
  virtual ~Recipe() = default;

  Id idBase() const { return idBase_; }

  virtual void build(Scene& scene) const = 0;

  // Return IDs of all DrawItems created by this recipe.
  virtual std::vector<Id> drawItemIds() const { return {}; }

protected:
  Id idBase_;

  // Deterministic ID: idBase_ + offset
  Id rid(std::uint32_t offset) const {
    return idBase_ + static_cast<Id>(offset);
  }

  // Buffer rid(slot), Geometry rid(slot+1), DrawItem rid(slot+2) bound to `pipeline`.
  void addBoundItem(Scene& scene, std::uint32_t slot, Id layerId, const std::string& name,
                    const char* pipeline, VertexFormat format, Id transformId) const;

  // Copy float records into buffer rid(slot) and size geometry rid(slot+1).
  void setVertexData(Scene& scene, std::uint32_t slot, VertexFormat format,
                     const std::vector<float>& data) const;
};

} // namespace tc
