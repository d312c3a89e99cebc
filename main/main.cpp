#include "organ_runtime.hpp"
#include "esp_log.h"
#include "light_organ/config.hpp"
#include "light_organ/errors.hpp"
#include <csignal>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

static const char* TAG = "main";
static OrganRuntime s_runtime;
static OrganConfig s_cfg{};

namespace {

// stdout carries wire frames only.
int log_to_stderr(const char* fmt, va_list args) {
  return vfprintf(stderr, fmt, args);
}

void on_stop_signal(int) {
  s_runtime.request_stop();
}

void install_signal_handlers() {
  struct sigaction sa = {};
  sa.sa_handler = on_stop_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;  // no SA_RESTART: blocking reads return EINTR and see the stop flag
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
}

}  // namespace

extern "C" void app_main(void) {
  esp_log_set_vprintf(log_to_stderr);
  install_signal_handlers();

  esp_err_t err = config_load(s_cfg);
  if (err == ESP_OK) {
    err = config_validate(s_cfg);
  }
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "config: %s", esp_err_to_name(err));
    exit(kOrganExitConfig);
  }
  esp_log_level_set("*", log_level_from_string(s_cfg.log_level));
  ESP_LOGI(TAG, "Light organ: %u LEDs, %u bands, %s wire", static_cast<unsigned>(s_cfg.led_count),
           static_cast<unsigned>(s_cfg.analysis.bands), wire_mode_to_string(s_cfg.transport.wire));
  ESP_LOGD(TAG, "Config: %s", config_to_json(s_cfg).c_str());

  err = s_runtime.init(s_cfg);
  if (err != ESP_OK) {
    if (err == ORGAN_ERR_TRANSPORT_CLOSED) {
      ESP_LOGE(TAG, "transport: %s", organ_err_to_name(err));
      exit(kOrganExitTransport);
    }
    ESP_LOGE(TAG, "config: %s", organ_err_to_name(err));
    exit(kOrganExitConfig);
  }

  exit(s_runtime.run());
}
