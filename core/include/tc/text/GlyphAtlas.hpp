#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tc {

struct GlyphInfo {
  std::uint32_t codepoint{0};
  // UV in atlas [0..1]
  float u0{0}, v0{0}, u1{0}, v1{0};
  // Metrics in pixels at the rasterized size
  float advance{0};
  float bearingX{0}, bearingY{0};
  float w{0}, h{0};
};

// Single-font glyph cache packed into one R8 texture (shelf packing).
class GlyphAtlas {
public:
  GlyphAtlas();

  // Load a TTF/OTF from memory. Returns false if the data is not a font.
  bool loadFont(const std::uint8_t* data, std::uint32_t len);

  // Load a TTF/OTF from file. Errors go to stderr.
  bool loadFontFile(const std::string& path);

  bool fontLoaded() const { return fontLoaded_; }

  // Ensure glyphs for a set of codepoints are rasterized and packed.
  // Returns true if atlas was modified (needs re-upload).
  bool ensureGlyphs(const std::uint32_t* codepoints, std::uint32_t count);

  // Convenience: ensure ASCII printable (32..126).
  bool ensureAscii();

  // Lookup glyph info. Returns nullptr if not rasterized.
  const GlyphInfo* getGlyph(std::uint32_t codepoint) const;

  // Atlas R8 pixel data.
  const std::uint8_t* atlasData() const { return atlas_.data(); }
  std::uint32_t atlasSize() const { return atlasSize_; }

  // True if atlas pixels changed since last call to clearDirty().
  bool isDirty() const { return dirty_; }
  void clearDirty() { dirty_ = false; }

  // Vertical font metrics in pixels at glyphPx.
  float ascent() const { return ascent_; }
  float descent() const { return descent_; }     // negative
  float lineHeight() const { return ascent_ - descent_ + lineGap_; }

  // Parameters (set before the first ensureGlyphs)
  void setGlyphPx(std::uint32_t px) { glyphPx_ = px; }
  std::uint32_t glyphPx() const { return glyphPx_; }
  void setSdfRange(std::uint32_t r) { sdfRange_ = r; }
  void setAtlasSize(std::uint32_t s);

  // When false, stores raw rasterized alpha instead of SDF.
  // Crisper at small sizes close to glyphPx.
  void setUseSdf(bool v) { useSdf_ = v; }
  bool useSdf() const { return useSdf_; }

private:
  std::uint32_t atlasSize_{1024};
  std::uint32_t glyphPx_{48};
  std::uint32_t sdfRange_{12};
  std::uint32_t pad_{2};
  bool useSdf_{true};

  std::vector<std::uint8_t> atlas_;    // R8 atlas (atlasSize_ x atlasSize_)
  std::vector<std::uint8_t> fontData_; // retained font file bytes
  bool fontLoaded_{false};
  bool dirty_{false};

  float ascent_{0};
  float descent_{0};
  float lineGap_{0};

  std::unordered_map<std::uint32_t, GlyphInfo> glyphs_;

  // Shelf packer state
  struct Shelf {
    std::uint32_t x, y, h;
  };
  std::vector<Shelf> shelves_;

  bool packGlyph(std::uint32_t w, std::uint32_t h,
                 std::uint32_t& outX, std::uint32_t& outY);

  // SDF helpers
  static void distanceTransform(float* field, std::uint32_t w, std::uint32_t h);
  static void buildSdfR8(const std::uint8_t* alpha, std::uint32_t w, std::uint32_t h,
                         std::uint32_t sdfRange, std::uint8_t* out);
};

} // namespace tc
