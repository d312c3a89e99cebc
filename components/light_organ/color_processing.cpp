#include "light_organ/color_processing.hpp"
#include <algorithm>
#include <cmath>

namespace {

uint8_t to_channel(float v) {
  const long value = std::lround(v * 255.0f);
  return static_cast<uint8_t>(std::clamp(value, 0L, 255L));
}

}  // namespace

GammaTable build_gamma_table(float gamma) {
  GammaTable table{};
  for (size_t i = 0; i < table.size(); ++i) {
    if (std::abs(gamma - 1.0f) < 1e-6f || gamma <= 0.0f) {
      table[i] = static_cast<uint8_t>(i);
      continue;
    }
    const float normalized = static_cast<float>(i) / 255.0f;
    table[i] = to_channel(std::pow(normalized, gamma));
  }
  return table;
}

Rgb8 hsv_to_rgb(float h, float s, float v) {
  h = std::fmod(h, 360.0f);
  if (h < 0) h += 360.0f;
  s = std::clamp(s, 0.0f, 1.0f);
  v = std::clamp(v, 0.0f, 1.0f);

  float c = v * s;
  float x = c * (1.0f - std::abs(std::fmod(h / 60.0f, 2.0f) - 1.0f));
  float m = v - c;

  float r = 0, g = 0, b = 0;

  if (h < 60) {
    r = c; g = x; b = 0;
  } else if (h < 120) {
    r = x; g = c; b = 0;
  } else if (h < 180) {
    r = 0; g = c; b = x;
  } else if (h < 240) {
    r = 0; g = x; b = c;
  } else if (h < 300) {
    r = x; g = 0; b = c;
  } else {
    r = c; g = 0; b = x;
  }

  return Rgb8{to_channel(r + m), to_channel(g + m), to_channel(b + m)};
}

Rgb8 scale_color(const Rgb8& color, uint8_t level) {
  auto scale = [level](uint8_t c) {
    return static_cast<uint8_t>((static_cast<uint16_t>(c) * level + 127) / 255);
  };
  return Rgb8{scale(color.r), scale(color.g), scale(color.b)};
}
