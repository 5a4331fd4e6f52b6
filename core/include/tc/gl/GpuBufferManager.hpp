#pragma once
#include "tc/scene/Types.hpp"
#include <glad/gl.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace tc {

class Scene;

// CPU-side mirror of scene buffers plus their GL VBOs.
class GpuBufferManager {
public:
  GpuBufferManager() = default;
  ~GpuBufferManager();

  GpuBufferManager(const GpuBufferManager&) = delete;
  GpuBufferManager& operator=(const GpuBufferManager&) = delete;

  // Store CPU-side bytes for a buffer ID.
  void setCpuData(Id bufferId, const void* data, std::uint32_t bytes);

  // Copy every buffer of the scene.
  void syncFromScene(const Scene& scene);

  // Upload any dirty buffers to GL VBOs. Returns total bytes uploaded.
  std::uint64_t uploadDirty();

  // Get the GL buffer name for a given ID (0 if not uploaded yet or empty).
  GLuint getGlBuffer(Id bufferId) const;

  std::uint32_t bufferCount() const { return static_cast<std::uint32_t>(entries_.size()); }

private:
  struct Entry {
    std::vector<std::uint8_t> cpuData;
    GLuint vbo{0};
    bool dirty{false};
  };
  std::unordered_map<Id, Entry> entries_;
};

} // namespace tc
