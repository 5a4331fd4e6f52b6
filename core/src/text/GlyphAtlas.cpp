#include "tc/text/GlyphAtlas.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace tc {

GlyphAtlas::GlyphAtlas() {
  setAtlasSize(atlasSize_);
}

void GlyphAtlas::setAtlasSize(std::uint32_t s) {
  atlasSize_ = s;
  atlas_.assign(static_cast<std::size_t>(s) * s, 0);
  shelves_.clear();
  shelves_.push_back({1, 1, 0});
  glyphs_.clear();
  dirty_ = true;
}

bool GlyphAtlas::loadFont(const std::uint8_t* data, std::uint32_t len) {
  if (!data || len == 0 || stbtt_GetFontOffsetForIndex(data, 0) < 0) {
    std::fprintf(stderr, "GlyphAtlas: data is not a TrueType/OpenType font\n");
    return false;
  }
  fontData_.assign(data, data + len);

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    fontData_.clear();
    return false;
  }
  int asc = 0, desc = 0, gap = 0;
  stbtt_GetFontVMetrics(&font, &asc, &desc, &gap);
  float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  ascent_ = static_cast<float>(asc) * scale;
  descent_ = static_cast<float>(desc) * scale;
  lineGap_ = static_cast<float>(gap) * scale;

  // A new font invalidates everything packed so far.
  setAtlasSize(atlasSize_);
  fontLoaded_ = true;
  return true;
}

bool GlyphAtlas::loadFontFile(const std::string& path) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas: cannot open font '%s'\n", path.c_str());
    return false;
  }
  auto sz = f.tellg();
  if (sz <= 0) {
    std::fprintf(stderr, "GlyphAtlas: font '%s' is empty\n", path.c_str());
    return false;
  }
  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(bytes.data()), sz);
  if (!f) {
    std::fprintf(stderr, "GlyphAtlas: short read on '%s'\n", path.c_str());
    return false;
  }
  return loadFont(bytes.data(), static_cast<std::uint32_t>(bytes.size()));
}

bool GlyphAtlas::ensureAscii() {
  std::vector<std::uint32_t> cp;
  for (std::uint32_t c = 32; c <= 126; c++) cp.push_back(c);
  return ensureGlyphs(cp.data(), static_cast<std::uint32_t>(cp.size()));
}

bool GlyphAtlas::ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count) {
  if (!fontLoaded_) return false;

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(), 0)) {
    std::fprintf(stderr, "GlyphAtlas: stbtt_InitFont failed\n");
    return false;
  }

  float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(glyphPx_));
  bool modified = false;

  for (std::uint32_t i = 0; i < count; i++) {
    std::uint32_t cp = codepoints[i];
    if (glyphs_.find(cp) != glyphs_.end()) continue;

    int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));

    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);

    int ix0, iy0, ix1, iy1;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

    int gw = ix1 - ix0;
    int gh = iy1 - iy0;

    GlyphInfo info;
    info.codepoint = cp;
    info.advance = static_cast<float>(advW) * scale;
    info.bearingX = static_cast<float>(ix0);
    info.bearingY = static_cast<float>(-iy0);

    if (gw <= 0 || gh <= 0) {
      // Whitespace glyph: metrics only
      glyphs_[cp] = info;
      continue;
    }

    std::vector<std::uint8_t> bitmap(static_cast<std::size_t>(gw) * gh, 0);
    stbtt_MakeGlyphBitmap(&font, bitmap.data(), gw, gh, gw, scale, scale, glyphIdx);

    std::uint32_t cellW = static_cast<std::uint32_t>(gw);
    std::uint32_t cellH = static_cast<std::uint32_t>(gh);
    std::vector<std::uint8_t> pixels;
    if (useSdf_) {
      pixels.resize(static_cast<std::size_t>(cellW) * cellH);
      buildSdfR8(bitmap.data(), cellW, cellH, sdfRange_, pixels.data());
    } else {
      pixels.swap(bitmap);
    }

    std::uint32_t ax, ay;
    if (!packGlyph(cellW + pad_ * 2, cellH + pad_ * 2, ax, ay)) {
      std::fprintf(stderr, "GlyphAtlas: atlas full (cp=%u)\n", cp);
      continue;
    }

    for (std::uint32_t row = 0; row < cellH; row++) {
      std::uint32_t dstY = ay + pad_ + row;
      std::uint32_t dstX = ax + pad_;
      std::memcpy(&atlas_[static_cast<std::size_t>(dstY) * atlasSize_ + dstX],
                  &pixels[static_cast<std::size_t>(row) * cellW], cellW);
    }

    // Atlas row 0 is the top of the glyph while quad uv.y runs bottom->top,
    // so v0 addresses the bottom row and v1 the top row.
    float invAtlas = 1.0f / static_cast<float>(atlasSize_);
    info.u0 = static_cast<float>(ax + pad_) * invAtlas;
    info.u1 = static_cast<float>(ax + pad_ + cellW) * invAtlas;
    info.v0 = static_cast<float>(ay + pad_ + cellH) * invAtlas;
    info.v1 = static_cast<float>(ay + pad_) * invAtlas;
    info.w = static_cast<float>(gw);
    info.h = static_cast<float>(gh);
    glyphs_[cp] = info;
    modified = true;
  }

  if (modified) dirty_ = true;
  return modified;
}

const GlyphInfo* GlyphAtlas::getGlyph(std::uint32_t codepoint) const {
  auto it = glyphs_.find(codepoint);
  return it == glyphs_.end() ? nullptr : &it->second;
}

bool GlyphAtlas::packGlyph(std::uint32_t w, std::uint32_t h,
                           std::uint32_t& outX, std::uint32_t& outY) {
  for (auto& shelf : shelves_) {
    if (shelf.x + w <= atlasSize_ - 1 && shelf.y + h <= atlasSize_ - 1) {
      if (shelf.h == 0) shelf.h = h;
      if (h <= shelf.h) {
        outX = shelf.x;
        outY = shelf.y;
        shelf.x += w;
        return true;
      }
    }
  }

  auto& last = shelves_.back();
  std::uint32_t ny = last.y + last.h;
  if (ny + h > atlasSize_ - 1) return false;

  outX = 1;
  outY = ny;
  shelves_.push_back({1 + w, ny, h});
  return true;
}

// 2-pass chamfer distance transform
void GlyphAtlas::distanceTransform(float* field, std::uint32_t w, std::uint32_t h) {
  constexpr float INF = 1e20f;
  constexpr float DIAG = 1.4142135f;

  for (std::uint32_t y = 0; y < h; y++) {
    for (std::uint32_t x = 0; x < w; x++) {
      std::size_t i = static_cast<std::size_t>(y) * w + x;
      if (field[i] == 0.0f) continue;

      field[i] = INF;
      if (x > 0)
        field[i] = std::min(field[i], field[i - 1] + 1.0f);
      if (y > 0)
        field[i] = std::min(field[i], field[i - w] + 1.0f);
      if (x > 0 && y > 0)
        field[i] = std::min(field[i], field[i - w - 1] + DIAG);
      if (x + 1 < w && y > 0)
        field[i] = std::min(field[i], field[i - w + 1] + DIAG);
    }
  }

  for (std::uint32_t y = h; y-- > 0; ) {
    for (std::uint32_t x = w; x-- > 0; ) {
      std::size_t i = static_cast<std::size_t>(y) * w + x;
      if (field[i] == 0.0f) continue;

      if (x + 1 < w)
        field[i] = std::min(field[i], field[i + 1] + 1.0f);
      if (y + 1 < h)
        field[i] = std::min(field[i], field[i + w] + 1.0f);
      if (x + 1 < w && y + 1 < h)
        field[i] = std::min(field[i], field[i + w + 1] + DIAG);
      if (x > 0 && y + 1 < h)
        field[i] = std::min(field[i], field[i + w - 1] + DIAG);
    }
  }
}

void GlyphAtlas::buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                            std::uint32_t sdfRange, std::uint8_t* out) {
  std::size_t n = static_cast<std::size_t>(w) * h;
  float rangePx = static_cast<float>(sdfRange);

  std::vector<float> inside(n);
  std::vector<float> outside(n);
  for (std::size_t i = 0; i < n; i++) {
    bool isIn = alpha[i] > 127;
    inside[i]  = isIn ? 1.0f : 0.0f;
    outside[i] = isIn ? 0.0f : 1.0f;
  }

  distanceTransform(inside.data(), w, h);
  distanceTransform(outside.data(), w, h);

  for (std::size_t i = 0; i < n; i++) {
    float sd = inside[i] - outside[i]; // positive inside, negative outside
    float clamped = std::max(-rangePx, std::min(rangePx, sd));
    float normalized = 128.0f + (clamped / rangePx) * 127.0f;
    out[i] = static_cast<std::uint8_t>(std::max(0.0f, std::min(255.0f, normalized)));
  }
}

} // namespace tc
