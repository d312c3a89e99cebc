#include "light_organ/wire_codec.hpp"
#include "light_organ/errors.hpp"

namespace {

bool is_blank(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\r' || ch == '\n';
}

void append_value(std::string& out, uint8_t v) {
  char buf[4];
  size_t n = 0;
  if (v >= 100) buf[n++] = static_cast<char>('0' + v / 100);
  if (v >= 10) buf[n++] = static_cast<char>('0' + (v / 10) % 10);
  buf[n++] = static_cast<char>('0' + v % 10);
  out.append(buf, n);
}

template <typename Fn>
std::string encode_line(size_t count, Fn value_at) {
  std::string out;
  out.reserve(count * 4 + 1);
  for (size_t i = 0; i < count; ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    append_value(out, value_at(i));
  }
  out.push_back('\n');
  return out;
}

}  // namespace

std::string wire_encode_pixels(const PixelFrame& frame) {
  return encode_line(frame.pixels.size() * 3, [&frame](size_t i) {
    const Rgb8& px = frame.pixels[i / 3];
    switch (i % 3) {
      case 0:
        return px.r;
      case 1:
        return px.g;
      default:
        return px.b;
    }
  });
}

std::string wire_encode_bands(const BandEnergy& bands) {
  return encode_line(bands.values.size(), [&bands](size_t i) { return bands.values[i]; });
}

std::string wire_encode_zeros(size_t count) {
  return encode_line(count, [](size_t) { return static_cast<uint8_t>(0); });
}

esp_err_t wire_decode_values(const char* line, size_t len, size_t expected, std::vector<uint8_t>& out) {
  if (!line || expected == 0) {
    return ESP_ERR_INVALID_ARG;
  }
  size_t begin = 0;
  size_t end = len;
  while (begin < end && is_blank(line[begin])) ++begin;
  while (end > begin && is_blank(line[end - 1])) --end;

  std::vector<uint8_t> values;
  values.reserve(expected);
  size_t i = begin;
  while (i < end) {
    unsigned value = 0;
    size_t digits = 0;
    while (i < end && line[i] >= '0' && line[i] <= '9') {
      value = value * 10 + static_cast<unsigned>(line[i] - '0');
      ++digits;
      ++i;
      if (digits > 3) {
        return ORGAN_ERR_MALFORMED_FRAME;
      }
    }
    if (digits == 0 || value > 255) {
      return ORGAN_ERR_MALFORMED_FRAME;
    }
    // Exactly one space between values; the next token must start right after.
    if (i < end) {
      if (line[i] != ' ') {
        return ORGAN_ERR_MALFORMED_FRAME;
      }
      ++i;
    }
    if (values.size() == expected) {
      return ORGAN_ERR_MALFORMED_FRAME;
    }
    values.push_back(static_cast<uint8_t>(value));
  }
  if (values.size() != expected) {
    return ORGAN_ERR_MALFORMED_FRAME;
  }
  out.swap(values);
  return ESP_OK;
}

esp_err_t wire_decode_pixels(const std::string& line, uint16_t led_count, PixelFrame& out) {
  std::vector<uint8_t> values;
  const esp_err_t err = wire_decode_values(line.data(), line.size(), static_cast<size_t>(led_count) * 3, values);
  if (err != ESP_OK) {
    return err;
  }
  out.pixels.resize(led_count);
  for (size_t i = 0; i < led_count; ++i) {
    out.pixels[i] = Rgb8{values[i * 3], values[i * 3 + 1], values[i * 3 + 2]};
  }
  return ESP_OK;
}

esp_err_t wire_decode_bands(const std::string& line, uint16_t band_count, BandEnergy& out) {
  std::vector<uint8_t> values;
  const esp_err_t err = wire_decode_values(line.data(), line.size(), band_count, values);
  if (err != ESP_OK) {
    return err;
  }
  out.values.swap(values);
  return ESP_OK;
}
