#pragma once
#include <string>

namespace tc {

struct Theme {
  std::string name;

  // Background
  float backgroundColor[4] = {0x0f / 255.0f, 0x0f / 255.0f, 0x0f / 255.0f, 1.0f};

  // Candle colors (volume bars reuse these)
  float candleUp[4] = {0x15 / 255.0f, 0xff / 255.0f, 0x25 / 255.0f, 1.0f};
  float candleDown[4] = {0xff / 255.0f, 0x84 / 255.0f, 0x86 / 255.0f, 1.0f};

  // Grid/axis
  float gridColor[4] = {0x86 / 255.0f, 0x86 / 255.0f, 0x86 / 255.0f, 0.5f};
  float tickColor[4] = {0x86 / 255.0f, 0x86 / 255.0f, 0x86 / 255.0f, 1.0f};
  float labelColor[4] = {0x86 / 255.0f, 0x86 / 255.0f, 0x86 / 255.0f, 1.0f};
  float gridLineWidth{0.5f};
  float tickLineWidth{1.0f};

  // Moving-average overlay
  float smaColor[4] = {0xe2 / 255.0f, 0xe2 / 255.0f, 0xe2 / 255.0f, 1.0f};
  float smaLineWidth{1.5f};

  // Trend annotation accent when the close sits on the average
  float onSmaColor[4] = {1.0f, 1.0f, 0.0f, 1.0f};

  // Text
  float textColor[4] = {0x86 / 255.0f, 0x86 / 255.0f, 0x86 / 255.0f, 1.0f};
};

Theme darkTheme();

// "#rrggbb" or "#rrggbbaa" -> RGBA in [0,1]. Returns false on malformed input.
bool parseHexColor(const std::string& text, float out[4]);

// RGBA -> "#rrggbb", or "#rrggbbaa" when alpha is not 1.
std::string formatHexColor(const float rgba[4]);

} // namespace tc
