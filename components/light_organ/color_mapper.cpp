#include "light_organ/color_mapper.hpp"
#include <algorithm>
#include <utility>

namespace {

constexpr Rgb8 kGroupColors[3] = {
    {0, 0, 255},  // low: blue
    {255, 0, 0},  // mid: red
    {0, 255, 0},  // high: green
};

}  // namespace

Rgb8 RainbowStrategy::color(size_t led, size_t led_count, uint8_t level) const {
  const float hue = led_count > 0 ? 360.0f * static_cast<float>(led) / led_count : 0.0f;
  return scale_color(hsv_to_rgb(hue, 1.0f, 1.0f), level);
}

Rgb8 HueGroupsStrategy::color(size_t led, size_t led_count, uint8_t level) const {
  const size_t group = led_count > 0 ? std::min<size_t>(2, led * 3 / led_count) : 0;
  return scale_color(kGroupColors[group], level);
}

Rgb8 SingleHueStrategy::color(size_t, size_t, uint8_t level) const {
  return scale_color(hsv_to_rgb(hue_, saturation_, 1.0f), level);
}

std::unique_ptr<ColorStrategy> make_color_strategy(const MapperConfig& cfg) {
  switch (cfg.strategy) {
    case ColorStrategyType::HueGroups:
      return std::make_unique<HueGroupsStrategy>();
    case ColorStrategyType::SingleHue:
      return std::make_unique<SingleHueStrategy>(cfg.hue, cfg.saturation);
    case ColorStrategyType::Rainbow:
      break;
  }
  return std::make_unique<RainbowStrategy>();
}

std::vector<uint8_t> assign_led_levels(const std::vector<uint8_t>& bands, size_t led_count) {
  std::vector<uint8_t> levels(led_count, 0);
  const size_t band_count = bands.size();
  if (band_count == 0) {
    return levels;
  }
  for (size_t i = 0; i < led_count; ++i) {
    if (band_count > led_count) {
      const size_t begin = i * band_count / led_count;
      const size_t end = (i + 1) * band_count / led_count;
      uint32_t acc = 0;
      for (size_t b = begin; b < end; ++b) {
        acc += bands[b];
      }
      levels[i] = static_cast<uint8_t>((acc + (end - begin) / 2) / (end - begin));
    } else {
      levels[i] = bands[i * band_count / led_count];
    }
  }
  return levels;
}

ColorMapper::ColorMapper(const MapperConfig& cfg, uint16_t led_count)
    : ColorMapper(make_color_strategy(cfg), cfg, led_count) {}

ColorMapper::ColorMapper(std::unique_ptr<ColorStrategy> strategy, const MapperConfig& cfg, uint16_t led_count)
    : strategy_(std::move(strategy)),
      led_count_(led_count),
      brightness_(cfg.brightness),
      gamma_(build_gamma_table(cfg.gamma)) {
  if (!strategy_) {
    strategy_ = std::make_unique<RainbowStrategy>();
  }
}

PixelFrame ColorMapper::map(const BandEnergy& bands) const {
  PixelFrame frame{};
  frame.seq = bands.seq;
  frame.pixels.resize(led_count_);
  const std::vector<uint8_t> levels = assign_led_levels(bands.values, led_count_);
  for (size_t i = 0; i < led_count_; ++i) {
    const Rgb8 c = scale_color(strategy_->color(i, led_count_, levels[i]), brightness_);
    frame.pixels[i] = Rgb8{gamma_[c.r], gamma_[c.g], gamma_[c.b]};
  }
  return frame;
}

PixelFrame ColorMapper::blank(uint64_t seq) const {
  PixelFrame frame{};
  frame.seq = seq;
  frame.pixels.assign(led_count_, Rgb8{});
  return frame;
}
