#pragma once
#include <cstdint>
#include <vector>

namespace tc {

// An offscreen GL 3.3 core context with its own color buffer.
class GlContext {
public:
  virtual ~GlContext() = default;

  virtual bool init(int width, int height) = 0;

  // Block until all issued GL commands have completed.
  virtual void finish() = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;

  // Read back RGBA pixels from the framebuffer (bottom row first).
  virtual std::vector<std::uint8_t> readPixels() const = 0;
};

} // namespace tc
