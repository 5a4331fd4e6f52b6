#pragma once
#include "tc/scene/Geometry.hpp"
#include <string>
#include <unordered_map>

namespace tc {

class Scene;

struct PipelineSpec {
  std::string name;   // "triSolid"
  int version{1};     // 1
  VertexFormat requiredVertexFormat{VertexFormat::Pos2_Clip};
};

inline std::string pipelineKey(const std::string& name, int version) {
  return name + "@" + std::to_string(version);
}

// Pipelines the renderer implements, keyed "name@version".
class PipelineCatalog {
public:
  PipelineCatalog();

  const PipelineSpec* find(const std::string& key) const;

private:
  std::unordered_map<std::string, PipelineSpec> specs_;
};

// Check every draw item binds a known pipeline to a geometry of the matching
// format whose buffer holds at least vertexCount records, and that referenced
// layers, panes and transforms exist. On failure writes a message to err.
bool validateScene(const Scene& scene, const PipelineCatalog& catalog, std::string& err);

} // namespace tc
