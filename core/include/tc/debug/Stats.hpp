#pragma once
#include <cstdint>

namespace tc {

struct Stats {
  // Timing
  double frameMs = 0.0;

  // Rendering
  std::uint32_t drawCalls = 0;

  // Upload activity
  std::uint64_t uploadedBytesThisFrame = 0;

  // Resource counts
  std::uint32_t activeBuffers = 0;
};

} // namespace tc
