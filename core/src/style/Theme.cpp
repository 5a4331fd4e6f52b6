#include "tc/style/Theme.hpp"

#include <cmath>
#include <cstdio>

namespace tc {

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

static int hexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool parseHexColor(const std::string& text, float out[4]) {
  if (text.size() != 7 && text.size() != 9) return false;
  if (text[0] != '#') return false;

  float rgba[4] = {0.0f, 0.0f, 0.0f, 1.0f};
  int channels = static_cast<int>(text.size() - 1) / 2;
  for (int i = 0; i < channels; i++) {
    int hi = hexDigit(text[1 + i * 2]);
    int lo = hexDigit(text[2 + i * 2]);
    if (hi < 0 || lo < 0) return false;
    rgba[i] = static_cast<float>(hi * 16 + lo) / 255.0f;
  }
  for (int i = 0; i < 4; i++) out[i] = rgba[i];
  return true;
}

static int toByte(float v) {
  if (v < 0.0f) v = 0.0f;
  if (v > 1.0f) v = 1.0f;
  return static_cast<int>(std::lround(v * 255.0f));
}

std::string formatHexColor(const float rgba[4]) {
  char buf[16];
  if (toByte(rgba[3]) == 255) {
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x",
                  toByte(rgba[0]), toByte(rgba[1]), toByte(rgba[2]));
  } else {
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x",
                  toByte(rgba[0]), toByte(rgba[1]), toByte(rgba[2]), toByte(rgba[3]));
  }
  return buf;
}

} // namespace tc
