#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

// A fully composed frame, rows top-down, RGBA8.
struct ChartImage {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgba;
};

// PNG encoding of RGBA frames. Output is 8-bit RGB (alpha dropped) using
// stored deflate blocks, so no zlib/libpng is needed.

// Encode top-down RGBA pixels. Returns an empty vector for a bad size.
std::vector<std::uint8_t> encodePng(const std::uint8_t* pixels, int width, int height);

// Write an encoded image to disk. Returns false if the file could not be
// fully written (diagnostic on stderr).
bool writeFileBytes(const std::string& path, const std::vector<std::uint8_t>& bytes);

// Read width/height from a PNG signature + IHDR. Returns false if the bytes
// are not a PNG.
bool readPngSize(const std::vector<std::uint8_t>& bytes, int& width, int& height);

// Encode as PNG into `<path>.tmp`, then rename over `path`. Nothing is left
// behind on failure. Throws RenderError.
void saveChartImage(const ChartImage& image, const std::string& path);

} // namespace tc
