#pragma once
#include "light_organ/color_processing.hpp"
#include "light_organ/types.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

// Visual style: color of one LED given its level (0..255).
class ColorStrategy {
 public:
  virtual ~ColorStrategy() = default;
  virtual const char* name() const = 0;
  virtual Rgb8 color(size_t led, size_t led_count, uint8_t level) const = 0;
};

// Hue spread evenly over the strip.
class RainbowStrategy : public ColorStrategy {
 public:
  const char* name() const override { return "rainbow"; }
  Rgb8 color(size_t led, size_t led_count, uint8_t level) const override;
};

// Three even LED groups: low = blue, mid = red, high = green.
class HueGroupsStrategy : public ColorStrategy {
 public:
  const char* name() const override { return "hue_groups"; }
  Rgb8 color(size_t led, size_t led_count, uint8_t level) const override;
};

class SingleHueStrategy : public ColorStrategy {
 public:
  SingleHueStrategy(float hue, float saturation) : hue_(hue), saturation_(saturation) {}
  const char* name() const override { return "single_hue"; }
  Rgb8 color(size_t led, size_t led_count, uint8_t level) const override;

 private:
  float hue_;
  float saturation_;
};

std::unique_ptr<ColorStrategy> make_color_strategy(const MapperConfig& cfg);

// Band to LED assignment: more bands than LEDs are averaged in even contiguous
// groups, more LEDs than bands repeat band floor(i * bands / leds).
std::vector<uint8_t> assign_led_levels(const std::vector<uint8_t>& bands, size_t led_count);

class ColorMapper {
 public:
  ColorMapper(const MapperConfig& cfg, uint16_t led_count);
  ColorMapper(std::unique_ptr<ColorStrategy> strategy, const MapperConfig& cfg, uint16_t led_count);

  PixelFrame map(const BandEnergy& bands) const;
  PixelFrame blank(uint64_t seq) const;

  uint16_t led_count() const { return led_count_; }
  const ColorStrategy& strategy() const { return *strategy_; }

 private:
  std::unique_ptr<ColorStrategy> strategy_;
  uint16_t led_count_;
  uint8_t brightness_;
  GammaTable gamma_;
};
