#include "tc/export/ChartSnapshot.hpp"
#include "tc/data/Errors.hpp"
#include <algorithm>
#include <array>
#include <cstdio>
#include <string>

namespace tc {

namespace {

constexpr std::uint8_t kPngSignature[8] = {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A};
constexpr std::size_t kMaxStoredBlock = 65535;

// CRC32 table, ISO 3309 polynomial (reflected).
const std::array<std::uint32_t, 256>& crcTable() {
  static const std::array<std::uint32_t, 256> table = [] {
    std::array<std::uint32_t, 256> t{};
    for (std::uint32_t n = 0; n < 256; n++) {
      std::uint32_t c = n;
      for (int k = 0; k < 8; k++) {
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      }
      t[n] = c;
    }
    return t;
  }();
  return table;
}

std::uint32_t crc32(const std::uint8_t* data, std::size_t len) {
  const auto& table = crcTable();
  std::uint32_t c = 0xFFFFFFFFu;
  for (std::size_t i = 0; i < len; i++) {
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  }
  return c ^ 0xFFFFFFFFu;
}

std::uint32_t adler32(const std::uint8_t* data, std::size_t len) {
  constexpr std::uint32_t kMod = 65521u;
  constexpr std::size_t kRun = 5552; // longest run without 32-bit overflow
  std::uint32_t a = 1, b = 0;
  std::size_t offset = 0;
  while (offset < len) {
    std::size_t end = std::min(len, offset + kRun);
    for (; offset < end; offset++) {
      a += data[offset];
      b += a;
    }
    a %= kMod;
    b %= kMod;
  }
  return (b << 16) | a;
}

void appendBE32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
  buf.push_back(static_cast<std::uint8_t>(v >> 24));
  buf.push_back(static_cast<std::uint8_t>(v >> 16));
  buf.push_back(static_cast<std::uint8_t>(v >> 8));
  buf.push_back(static_cast<std::uint8_t>(v));
}

std::uint32_t readBE32(const std::uint8_t* p) {
  return (std::uint32_t(p[0]) << 24) | (std::uint32_t(p[1]) << 16) |
         (std::uint32_t(p[2]) << 8) | std::uint32_t(p[3]);
}

void appendChunk(std::vector<std::uint8_t>& out, const char* type,
                 const std::vector<std::uint8_t>& payload) {
  appendBE32(out, static_cast<std::uint32_t>(payload.size()));
  std::size_t crcStart = out.size();
  out.insert(out.end(), type, type + 4);
  out.insert(out.end(), payload.begin(), payload.end());
  appendBE32(out, crc32(&out[crcStart], 4 + payload.size()));
}

// Scanlines with filter byte 0 (None), RGB triplets.
std::vector<std::uint8_t> scanlines(const std::uint8_t* rgba, int width, int height) {
  const std::size_t w = static_cast<std::size_t>(width);
  std::vector<std::uint8_t> raw;
  raw.reserve(static_cast<std::size_t>(height) * (1 + w * 3));
  for (int row = 0; row < height; row++) {
    const std::uint8_t* line = rgba + static_cast<std::size_t>(row) * w * 4;
    raw.push_back(0);
    for (std::size_t x = 0; x < w; x++) {
      raw.push_back(line[x * 4 + 0]);
      raw.push_back(line[x * 4 + 1]);
      raw.push_back(line[x * 4 + 2]);
    }
  }
  return raw;
}

// zlib stream made of uncompressed deflate blocks.
std::vector<std::uint8_t> zlibStored(const std::vector<std::uint8_t>& data) {
  std::vector<std::uint8_t> z;
  std::size_t blocks = std::max<std::size_t>(1, (data.size() + kMaxStoredBlock - 1) / kMaxStoredBlock);
  z.reserve(2 + blocks * 5 + data.size() + 4);
  z.push_back(0x78);
  z.push_back(0x01);

  std::size_t offset = 0;
  do {
    std::size_t n = std::min(data.size() - offset, kMaxStoredBlock);
    bool last = (offset + n == data.size());
    z.push_back(last ? 0x01 : 0x00);
    std::uint16_t len = static_cast<std::uint16_t>(n);
    std::uint16_t nlen = static_cast<std::uint16_t>(~len);
    z.push_back(static_cast<std::uint8_t>(len & 0xFF));
    z.push_back(static_cast<std::uint8_t>(len >> 8));
    z.push_back(static_cast<std::uint8_t>(nlen & 0xFF));
    z.push_back(static_cast<std::uint8_t>(nlen >> 8));
    z.insert(z.end(), data.begin() + static_cast<std::ptrdiff_t>(offset),
             data.begin() + static_cast<std::ptrdiff_t>(offset + n));
    offset += n;
  } while (offset < data.size());

  appendBE32(z, adler32(data.data(), data.size()));
  return z;
}

} // namespace

std::vector<std::uint8_t> encodePng(const std::uint8_t* pixels, int width, int height) {
  if (!pixels || width <= 0 || height <= 0) return {};

  std::vector<std::uint8_t> out(kPngSignature, kPngSignature + 8);

  std::vector<std::uint8_t> ihdr;
  appendBE32(ihdr, static_cast<std::uint32_t>(width));
  appendBE32(ihdr, static_cast<std::uint32_t>(height));
  ihdr.push_back(8); // bit depth
  ihdr.push_back(2); // RGB
  ihdr.push_back(0); // deflate
  ihdr.push_back(0); // adaptive filtering
  ihdr.push_back(0); // no interlace
  appendChunk(out, "IHDR", ihdr);
  appendChunk(out, "IDAT", zlibStored(scanlines(pixels, width, height)));
  appendChunk(out, "IEND", {});
  return out;
}

bool writeFileBytes(const std::string& path, const std::vector<std::uint8_t>& bytes) {
  FILE* f = std::fopen(path.c_str(), "wb");
  if (!f) {
    std::fprintf(stderr, "ChartSnapshot: cannot open '%s' for writing\n", path.c_str());
    return false;
  }
  std::size_t written = std::fwrite(bytes.data(), 1, bytes.size(), f);
  bool closed = (std::fclose(f) == 0);
  if (written != bytes.size() || !closed) {
    std::fprintf(stderr, "ChartSnapshot: short write to '%s'\n", path.c_str());
    return false;
  }
  return true;
}

bool readPngSize(const std::vector<std::uint8_t>& bytes, int& width, int& height) {
  // signature(8) + length(4) + "IHDR"(4) + width(4) + height(4)
  if (bytes.size() < 24) return false;
  if (!std::equal(kPngSignature, kPngSignature + 8, bytes.begin())) return false;
  if (bytes[12] != 'I' || bytes[13] != 'H' || bytes[14] != 'D' || bytes[15] != 'R') return false;
  width = static_cast<int>(readBE32(&bytes[16]));
  height = static_cast<int>(readBE32(&bytes[20]));
  return true;
}

void saveChartImage(const ChartImage& image, const std::string& path) {
  std::vector<std::uint8_t> bytes;
  if (image.width > 0 && image.height > 0 &&
      image.rgba.size() == static_cast<std::size_t>(image.width) * image.height * 4) {
    bytes = encodePng(image.rgba.data(), image.width, image.height);
  }
  if (bytes.empty()) {
    throw RenderError("cannot encode a " + std::to_string(image.width) + "x" +
                      std::to_string(image.height) + " image");
  }

  const std::string tmp = path + ".tmp";
  if (!writeFileBytes(tmp, bytes)) {
    std::remove(tmp.c_str());
    throw RenderError("cannot write '" + tmp + "'");
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    std::remove(tmp.c_str());
    throw RenderError("cannot move '" + tmp + "' to '" + path + "'");
  }
}

} // namespace tc
