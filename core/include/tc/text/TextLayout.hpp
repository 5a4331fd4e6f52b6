#pragma once
#include "tc/text/GlyphAtlas.hpp"
#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

namespace tc {

struct TextLayoutResult {
  std::vector<float> glyphInstances; // glyph8: x0,y0,x1,y1,u0,v0,u1,v1
  int glyphCount{0};
  float advanceWidth{0};
};

enum class TextAlign : std::uint8_t { Left, Center, Right };

// Width of a single line at fontSize. Stops at '\n'.
inline float measureText(const GlyphAtlas& atlas, const char* text, float fontSize) {
  float scale = fontSize / static_cast<float>(atlas.glyphPx());
  float width = 0;
  for (const char* p = text; *p && *p != '\n'; p++) {
    const GlyphInfo* g = atlas.getGlyph(static_cast<unsigned char>(*p));
    if (g) width += g->advance * scale;
  }
  return width;
}

// Lay out one line starting at startX on baselineY (pixels, y up).
// Appends into r so several runs can share one buffer.
inline void appendText(TextLayoutResult& r, const GlyphAtlas& atlas, const char* text,
                       float startX, float baselineY, float fontSize) {
  float cursorX = startX;
  float scale = fontSize / static_cast<float>(atlas.glyphPx());

  for (const char* p = text; *p && *p != '\n'; p++) {
    const GlyphInfo* g = atlas.getGlyph(static_cast<unsigned char>(*p));
    if (!g) continue;
    if (g->w <= 0 || g->h <= 0) {
      cursorX += g->advance * scale;
      continue;
    }
    float x0 = cursorX + g->bearingX * scale;
    float y1 = baselineY + g->bearingY * scale;
    float y0 = y1 - g->h * scale;
    float x1 = x0 + g->w * scale;
    r.glyphInstances.push_back(x0); r.glyphInstances.push_back(y0);
    r.glyphInstances.push_back(x1); r.glyphInstances.push_back(y1);
    r.glyphInstances.push_back(g->u0); r.glyphInstances.push_back(g->v0);
    r.glyphInstances.push_back(g->u1); r.glyphInstances.push_back(g->v1);
    r.glyphCount++;
    cursorX += g->advance * scale;
  }
  r.advanceWidth = std::max(r.advanceWidth, cursorX - startX);
}

inline TextLayoutResult layoutText(const GlyphAtlas& atlas, const char* text,
                                   float startX, float baselineY, float fontSize) {
  TextLayoutResult r;
  appendText(r, atlas, text, startX, baselineY, fontSize);
  return r;
}

// Multi-line text: lines split on '\n', each aligned against anchorX, the
// first baseline at firstBaselineY and following lines stepping downwards.
inline void appendTextLines(TextLayoutResult& r, const GlyphAtlas& atlas,
                            const std::string& text, float anchorX, float firstBaselineY,
                            float fontSize, TextAlign align) {
  float scale = fontSize / static_cast<float>(atlas.glyphPx());
  float lineStep = atlas.lineHeight() * scale;
  float baseline = firstBaselineY;

  std::size_t start = 0;
  while (start <= text.size()) {
    std::size_t nl = text.find('\n', start);
    std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);

    float width = measureText(atlas, line.c_str(), fontSize);
    float x = anchorX;
    if (align == TextAlign::Center) x -= width * 0.5f;
    else if (align == TextAlign::Right) x -= width;
    appendText(r, atlas, line.c_str(), x, baseline, fontSize);

    if (nl == std::string::npos) break;
    start = nl + 1;
    baseline -= lineStep;
  }
}

} // namespace tc
