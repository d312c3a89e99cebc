#pragma once
#include "light_organ/types.hpp"
#include <array>
#include <cstdint>

using GammaTable = std::array<uint8_t, 256>;

// Gamma lookup table; gamma == 1 yields the identity table.
GammaTable build_gamma_table(float gamma);

// Convert HSV to RGB (h in degrees, s and v in 0..1)
Rgb8 hsv_to_rgb(float h, float s, float v);

// Scale a color by level/255
Rgb8 scale_color(const Rgb8& color, uint8_t level);
