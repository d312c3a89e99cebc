#pragma once
#include "esp_err.h"
#include "light_organ/types.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Line format: space-separated integers in [0, 255], newline terminated.
// rgb mode carries r g b per LED, bands mode one value per band.

std::string wire_encode_pixels(const PixelFrame& frame);
std::string wire_encode_bands(const BandEnergy& bands);
std::string wire_encode_zeros(size_t count);

// Parses exactly `expected` values. Any wrong token count, non-integer token or
// value above 255 returns ORGAN_ERR_MALFORMED_FRAME and leaves `out` untouched.
// Surrounding whitespace and a trailing "\r" or "\n" are accepted.
esp_err_t wire_decode_values(const char* line, size_t len, size_t expected, std::vector<uint8_t>& out);

esp_err_t wire_decode_pixels(const std::string& line, uint16_t led_count, PixelFrame& out);
esp_err_t wire_decode_bands(const std::string& line, uint16_t band_count, BandEnergy& out);
