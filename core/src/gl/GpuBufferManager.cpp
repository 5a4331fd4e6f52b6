#include "tc/gl/GpuBufferManager.hpp"
#include "tc/scene/Scene.hpp"
#include <cstring>

namespace tc {

GpuBufferManager::~GpuBufferManager() {
  for (auto& [id, e] : entries_) {
    if (e.vbo) {
      glDeleteBuffers(1, &e.vbo);
    }
  }
}

void GpuBufferManager::setCpuData(Id bufferId, const void* data, std::uint32_t bytes) {
  auto& e = entries_[bufferId];
  e.cpuData.resize(bytes);
  if (bytes > 0) std::memcpy(e.cpuData.data(), data, bytes);
  e.dirty = true;
}

void GpuBufferManager::syncFromScene(const Scene& scene) {
  for (Id id : scene.bufferIds()) {
    const Buffer* b = scene.getBuffer(id);
    setCpuData(id, b->data.data(), b->byteLength());
  }
}

std::uint64_t GpuBufferManager::uploadDirty() {
  std::uint64_t uploaded = 0;
  for (auto& [id, e] : entries_) {
    if (!e.dirty) continue;
    e.dirty = false;
    if (e.cpuData.empty()) continue;
    if (!e.vbo) {
      glGenBuffers(1, &e.vbo);
    }
    glBindBuffer(GL_ARRAY_BUFFER, e.vbo);
    glBufferData(GL_ARRAY_BUFFER,
                 static_cast<GLsizeiptr>(e.cpuData.size()),
                 e.cpuData.data(),
                 GL_STATIC_DRAW);
    uploaded += e.cpuData.size();
  }
  glBindBuffer(GL_ARRAY_BUFFER, 0);
  return uploaded;
}

GLuint GpuBufferManager::getGlBuffer(Id bufferId) const {
  auto it = entries_.find(bufferId);
  if (it == entries_.end()) return 0;
  return it->second.vbo;
}

} // namespace tc
