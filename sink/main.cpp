#include "strip_output.hpp"
#include "esp_log.h"
#include "light_organ/color_mapper.hpp"
#include "light_organ/config.hpp"
#include "light_organ/errors.hpp"
#include "light_organ/wire_codec.hpp"
#include <atomic>
#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <sys/types.h>

static const char* TAG = "sink";
static std::atomic<bool> s_stop{false};

namespace {

int log_to_stderr(const char* fmt, va_list args) {
  return vfprintf(stderr, fmt, args);
}

void on_stop_signal(int) {
  s_stop.store(true);
}

bool is_blank_line(const char* line, size_t len) {
  for (size_t i = 0; i < len; ++i) {
    if (line[i] != ' ' && line[i] != '\t' && line[i] != '\r' && line[i] != '\n') {
      return false;
    }
  }
  return true;
}

}  // namespace

int main() {
  esp_log_set_vprintf(log_to_stderr);

  struct sigaction sa = {};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  OrganConfig cfg{};
  esp_err_t err = config_load(cfg);
  if (err == ESP_OK) {
    err = config_validate(cfg);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "config: %s", esp_err_to_name(err));
    return 1;
  }
  esp_log_level_set("*", log_level_from_string(cfg.log_level));

  std::unique_ptr<StripOutput> strip;
  err = strip_output_create(cfg.strip, strip);
  if (err == ESP_OK) {
    err = strip->open();
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "transport: strip output %s unavailable (%s)", strip_output_to_string(cfg.strip.output),
             esp_err_to_name(err));
    return 3;
  }

  const ColorMapper mapper(cfg.mapper, cfg.led_count);
  ESP_LOGI(TAG, "Reading %s frames for %u LEDs -> %s", wire_mode_to_string(cfg.transport.wire),
           static_cast<unsigned>(cfg.led_count), strip->name());

  char* line = nullptr;
  size_t cap = 0;
  uint64_t line_no = 0;
  uint64_t shown = 0;
  uint64_t rejected = 0;
  PixelFrame frame{};
  BandEnergy bands{};

  while (!s_stop.load()) {
    const ssize_t len = getline(&line, &cap, stdin);
    if (len < 0) {
      break;
    }
    ++line_no;
    if (is_blank_line(line, static_cast<size_t>(len))) {
      continue;
    }
    if (cfg.transport.wire == WireMode::Bands) {
      err = wire_decode_values(line, static_cast<size_t>(len), cfg.analysis.bands, bands.values);
      if (err == ESP_OK) {
        bands.seq = line_no;
        frame = mapper.map(bands);
      }
    } else {
      err = wire_decode_pixels(std::string(line, static_cast<size_t>(len)), cfg.led_count, frame);
      frame.seq = line_no;
    }
    if (err != ESP_OK) {
      ++rejected;
      ESP_LOGW(TAG, "Line %llu discarded: %s", static_cast<unsigned long long>(line_no), organ_err_to_name(err));
      continue;
    }
    if (strip->show(frame) == ESP_OK) {
      ++shown;
    }
  }
  free(line);

  // LEDs off before leaving.
  if (strip->show(mapper.blank(line_no + 1)) != ESP_OK) {
    ESP_LOGW(TAG, "Could not turn the strip off");
  }
  strip->close();
  ESP_LOGI(TAG, "Done: %llu frames shown, %llu malformed", static_cast<unsigned long long>(shown),
           static_cast<unsigned long long>(rejected));
  return 0;
}
