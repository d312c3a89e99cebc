#include "light_organ/config.hpp"
#include "cJSON.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <string>

static const char* TAG = "config";

namespace {

// Integral JSON numbers outside [0, max] decode as 0, which validation rejects.
uint32_t to_unsigned(double value, uint32_t max) {
  if (!std::isfinite(value) || value < 0.0 || value > static_cast<double>(max)) {
    return 0;
  }
  return static_cast<uint32_t>(std::lround(value));
}

bool read_number(cJSON* obj, const char* key, double& out) {
  cJSON* item = cJSON_GetObjectItem(obj, key);
  if (!item) {
    return false;
  }
  if (!cJSON_IsNumber(item)) {
    ESP_LOGW(TAG, "Ignoring %s: expected a number", key);
    return false;
  }
  out = item->valuedouble;
  return true;
}

bool read_string(cJSON* obj, const char* key, std::string& out) {
  cJSON* item = cJSON_GetObjectItem(obj, key);
  if (!item) {
    return false;
  }
  if (!cJSON_IsString(item) || !item->valuestring) {
    ESP_LOGW(TAG, "Ignoring %s: expected a string", key);
    return false;
  }
  out = item->valuestring;
  return true;
}

cJSON* read_object(cJSON* root, const char* key) {
  cJSON* item = cJSON_GetObjectItem(root, key);
  if (item && !cJSON_IsObject(item)) {
    ESP_LOGW(TAG, "Ignoring %s: expected an object", key);
    return nullptr;
  }
  return item;
}

bool color_strategy_from_string(const std::string& v, ColorStrategyType& out) {
  if (v == "rainbow") {
    out = ColorStrategyType::Rainbow;
  } else if (v == "hue_groups") {
    out = ColorStrategyType::HueGroups;
  } else if (v == "single_hue") {
    out = ColorStrategyType::SingleHue;
  } else {
    return false;
  }
  return true;
}

bool pipeline_mode_from_string(const std::string& v, PipelineMode& out) {
  if (v == "sync") {
    out = PipelineMode::Sync;
  } else if (v == "threaded") {
    out = PipelineMode::Threaded;
  } else {
    return false;
  }
  return true;
}

bool wire_mode_from_string(const std::string& v, WireMode& out) {
  if (v == "rgb") {
    out = WireMode::Rgb;
  } else if (v == "bands") {
    out = WireMode::Bands;
  } else {
    return false;
  }
  return true;
}

bool strip_output_from_string(const std::string& v, StripOutputType& out) {
  if (v == "log") {
    out = StripOutputType::Log;
  } else if (v == "ddp") {
    out = StripOutputType::Ddp;
  } else {
    return false;
  }
  return true;
}

void decode_capture(CaptureConfig& cfg, cJSON* obj) {
  double num = 0.0;
  read_string(obj, "device", cfg.device);
  if (read_number(obj, "sample_rate", num)) cfg.sample_rate = to_unsigned(num, 1000000);
  if (read_number(obj, "update_hz", num)) cfg.update_hz = static_cast<float>(num);
  if (read_number(obj, "delay_ms", num)) cfg.delay_ms = to_unsigned(num, 60000);
  if (read_number(obj, "max_retries", num)) {
    cfg.max_retries = static_cast<uint16_t>(to_unsigned(num, std::numeric_limits<uint16_t>::max()));
  }
}

void decode_analysis(AnalysisConfig& cfg, cJSON* obj) {
  double num = 0.0;
  if (read_number(obj, "fft_size", num)) {
    cfg.fft_size = static_cast<uint16_t>(to_unsigned(num, std::numeric_limits<uint16_t>::max()));
  }
  if (read_number(obj, "bands", num)) {
    cfg.bands = static_cast<uint16_t>(to_unsigned(num, std::numeric_limits<uint16_t>::max()));
  }
  if (read_number(obj, "low_hz", num)) cfg.low_hz = static_cast<float>(num);
  if (read_number(obj, "high_hz", num)) cfg.high_hz = static_cast<float>(num);
  if (read_number(obj, "decay", num)) cfg.decay = static_cast<float>(num);
  if (read_number(obj, "coupling", num)) cfg.coupling = static_cast<float>(num);
  if (read_number(obj, "floor", num)) cfg.floor = static_cast<float>(num);
}

bool decode_mapper(MapperConfig& cfg, cJSON* obj) {
  double num = 0.0;
  std::string text;
  if (read_string(obj, "strategy", text) && !color_strategy_from_string(text, cfg.strategy)) {
    ESP_LOGE(TAG, "mapper.strategy: unknown strategy '%s'", text.c_str());
    return false;
  }
  if (read_number(obj, "hue", num)) cfg.hue = static_cast<float>(num);
  if (read_number(obj, "saturation", num)) cfg.saturation = static_cast<float>(num);
  if (read_number(obj, "gamma", num)) cfg.gamma = static_cast<float>(num);
  if (read_number(obj, "brightness", num)) {
    cfg.brightness = static_cast<uint8_t>(std::clamp(static_cast<int>(std::lround(num)), 0, 255));
  }
  return true;
}

bool decode_json(OrganConfig& cfg, const char* json, size_t len) {
  cJSON* root = cJSON_ParseWithLength(json, len);
  if (!root) {
    ESP_LOGE(TAG, "Failed to parse config JSON");
    return false;
  }
  if (!cJSON_IsObject(root)) {
    ESP_LOGE(TAG, "Config JSON must be an object");
    cJSON_Delete(root);
    return false;
  }

  bool ok = true;
  double num = 0.0;
  std::string text;
  read_string(root, "log_level", cfg.log_level);
  if (read_number(root, "led_count", num)) {
    cfg.led_count = static_cast<uint16_t>(to_unsigned(num, std::numeric_limits<uint16_t>::max()));
  }

  if (cJSON* capture = read_object(root, "capture")) {
    decode_capture(cfg.capture, capture);
  }
  if (cJSON* analysis = read_object(root, "analysis")) {
    decode_analysis(cfg.analysis, analysis);
  }
  if (cJSON* mapper = read_object(root, "mapper")) {
    ok = decode_mapper(cfg.mapper, mapper) && ok;
  }
  if (cJSON* pipeline = read_object(root, "pipeline")) {
    if (read_string(pipeline, "mode", text) && !pipeline_mode_from_string(text, cfg.pipeline.mode)) {
      ESP_LOGE(TAG, "pipeline.mode: unknown mode '%s'", text.c_str());
      ok = false;
    }
    if (read_number(pipeline, "queue_depth", num)) cfg.pipeline.queue_depth = static_cast<uint8_t>(to_unsigned(num, 255));
  }
  if (cJSON* transport = read_object(root, "transport")) {
    read_string(transport, "output", cfg.transport.output);
    if (read_string(transport, "wire", text) && !wire_mode_from_string(text, cfg.transport.wire)) {
      ESP_LOGE(TAG, "transport.wire: unknown wire mode '%s'", text.c_str());
      ok = false;
    }
  }
  if (cJSON* strip = read_object(root, "strip")) {
    if (read_string(strip, "output", text) && !strip_output_from_string(text, cfg.strip.output)) {
      ESP_LOGE(TAG, "strip.output: unknown output '%s'", text.c_str());
      ok = false;
    }
    read_string(strip, "host", cfg.strip.host);
    if (read_number(strip, "port", num)) cfg.strip.port = static_cast<uint16_t>(to_unsigned(num, 65535));
  }

  cJSON_Delete(root);
  return ok;
}

std::string encode_json(const OrganConfig& cfg) {
  cJSON* root = cJSON_CreateObject();
  cJSON_AddStringToObject(root, "log_level", cfg.log_level.c_str());
  cJSON_AddNumberToObject(root, "led_count", cfg.led_count);

  cJSON* capture = cJSON_AddObjectToObject(root, "capture");
  cJSON_AddStringToObject(capture, "device", cfg.capture.device.c_str());
  cJSON_AddNumberToObject(capture, "sample_rate", cfg.capture.sample_rate);
  cJSON_AddNumberToObject(capture, "update_hz", cfg.capture.update_hz);
  cJSON_AddNumberToObject(capture, "delay_ms", cfg.capture.delay_ms);
  cJSON_AddNumberToObject(capture, "max_retries", cfg.capture.max_retries);

  cJSON* analysis = cJSON_AddObjectToObject(root, "analysis");
  cJSON_AddNumberToObject(analysis, "fft_size", cfg.analysis.fft_size);
  cJSON_AddNumberToObject(analysis, "bands", cfg.analysis.bands);
  cJSON_AddNumberToObject(analysis, "low_hz", cfg.analysis.low_hz);
  cJSON_AddNumberToObject(analysis, "high_hz", cfg.analysis.high_hz);
  cJSON_AddNumberToObject(analysis, "decay", cfg.analysis.decay);
  cJSON_AddNumberToObject(analysis, "coupling", cfg.analysis.coupling);
  cJSON_AddNumberToObject(analysis, "floor", cfg.analysis.floor);

  cJSON* mapper = cJSON_AddObjectToObject(root, "mapper");
  cJSON_AddStringToObject(mapper, "strategy", color_strategy_to_string(cfg.mapper.strategy));
  cJSON_AddNumberToObject(mapper, "hue", cfg.mapper.hue);
  cJSON_AddNumberToObject(mapper, "saturation", cfg.mapper.saturation);
  cJSON_AddNumberToObject(mapper, "gamma", cfg.mapper.gamma);
  cJSON_AddNumberToObject(mapper, "brightness", cfg.mapper.brightness);

  cJSON* pipeline = cJSON_AddObjectToObject(root, "pipeline");
  cJSON_AddStringToObject(pipeline, "mode", pipeline_mode_to_string(cfg.pipeline.mode));
  cJSON_AddNumberToObject(pipeline, "queue_depth", cfg.pipeline.queue_depth);

  cJSON* transport = cJSON_AddObjectToObject(root, "transport");
  cJSON_AddStringToObject(transport, "output", cfg.transport.output.c_str());
  cJSON_AddStringToObject(transport, "wire", wire_mode_to_string(cfg.transport.wire));

  cJSON* strip = cJSON_AddObjectToObject(root, "strip");
  cJSON_AddStringToObject(strip, "output", strip_output_to_string(cfg.strip.output));
  cJSON_AddStringToObject(strip, "host", cfg.strip.host.c_str());
  cJSON_AddNumberToObject(strip, "port", cfg.strip.port);

  char* txt = cJSON_PrintUnformatted(root);
  std::string out = txt ? txt : "{}";
  if (txt) {
    cJSON_free(txt);
  }
  cJSON_Delete(root);
  return out;
}

bool read_file(const char* path, std::string& out) {
  FILE* f = std::fopen(path, "rb");
  if (!f) {
    return false;
  }
  char chunk[512];
  size_t n = 0;
  while ((n = std::fread(chunk, 1, sizeof(chunk), f)) > 0) {
    out.append(chunk, n);
  }
  const bool ok = !std::ferror(f);
  std::fclose(f);
  return ok;
}

bool is_power_of_two(uint32_t v) {
  return v != 0 && (v & (v - 1)) == 0;
}

esp_err_t reject(const char* field, const char* rule) {
  ESP_LOGE(TAG, "Invalid config: %s %s", field, rule);
  return ESP_ERR_INVALID_ARG;
}

}  // namespace

size_t block_size_for(const CaptureConfig& cfg) {
  if (!(cfg.update_hz > 0.0f) || !std::isfinite(cfg.update_hz)) {
    return 0;
  }
  return static_cast<size_t>(std::lround(static_cast<double>(cfg.sample_rate) / cfg.update_hz));
}

void config_reset_defaults(OrganConfig& cfg) {
  cfg = OrganConfig{};
}

esp_err_t config_load(OrganConfig& cfg) {
  config_reset_defaults(cfg);

  if (const char* path = std::getenv(LIGHT_ORGAN_CONFIG_FILE_ENV); path && *path) {
    std::string blob;
    if (!read_file(path, blob)) {
      ESP_LOGE(TAG, "Cannot read config file %s", path);
      return ESP_ERR_NOT_FOUND;
    }
    ESP_LOGI(TAG, "Loading config file %s", path);
    if (!decode_json(cfg, blob.data(), blob.size())) {
      return ESP_ERR_INVALID_ARG;
    }
  }

  if (const char* json = std::getenv(LIGHT_ORGAN_CONFIG_ENV); json && *json) {
    ESP_LOGD(TAG, "Applying %s", LIGHT_ORGAN_CONFIG_ENV);
    std::string blob = json;
    if (!decode_json(cfg, blob.data(), blob.size())) {
      return ESP_ERR_INVALID_ARG;
    }
  }
  return ESP_OK;
}

esp_err_t config_apply_json(OrganConfig& cfg, const char* data, size_t len) {
  if (!data || len == 0) {
    return ESP_ERR_INVALID_ARG;
  }
  return decode_json(cfg, data, len) ? ESP_OK : ESP_ERR_INVALID_ARG;
}

std::string config_to_json(const OrganConfig& cfg) {
  return encode_json(cfg);
}

esp_err_t config_validate(const OrganConfig& cfg) {
  const auto& cap = cfg.capture;
  const auto& an = cfg.analysis;
  const auto& map = cfg.mapper;

  if (cfg.led_count < 1 || cfg.led_count > 4096) return reject("led_count", "must be 1..4096");
  if (cap.device.empty()) return reject("capture.device", "must not be empty");
  if (cap.sample_rate < 8000 || cap.sample_rate > 192000) return reject("capture.sample_rate", "must be 8000..192000");
  if (!is_power_of_two(an.fft_size) || an.fft_size < 256 || an.fft_size > 16384) {
    return reject("analysis.fft_size", "must be a power of two in 256..16384");
  }
  const size_t block = block_size_for(cap);
  if (block == 0 || block > an.fft_size) {
    return reject("capture.update_hz", "must give a block size of 1..fft_size samples");
  }
  if (an.bands < 1 || an.bands > 64) return reject("analysis.bands", "must be 1..64");
  if (!std::isfinite(an.low_hz) || !std::isfinite(an.high_hz) || an.low_hz <= 0.0f || an.low_hz >= an.high_hz) {
    return reject("analysis.low_hz/high_hz", "must satisfy 0 < low_hz < high_hz");
  }
  if (an.high_hz > cap.sample_rate / 2.0f) return reject("analysis.high_hz", "must not exceed sample_rate / 2");
  if (!(an.decay > 0.0f && an.decay < 1.0f)) return reject("analysis.decay", "must be in (0, 1)");
  if (!(an.coupling >= 0.0f && an.coupling <= 1.0f)) return reject("analysis.coupling", "must be in [0, 1]");
  if (!(an.floor >= 0.0f) || !std::isfinite(an.floor)) return reject("analysis.floor", "must be >= 0");
  if (!std::isfinite(map.hue)) return reject("mapper.hue", "must be finite");
  if (!(map.saturation >= 0.0f && map.saturation <= 1.0f)) return reject("mapper.saturation", "must be in [0, 1]");
  if (!(map.gamma > 0.0f) || !std::isfinite(map.gamma)) return reject("mapper.gamma", "must be > 0");
  if (cfg.pipeline.queue_depth < 1 || cfg.pipeline.queue_depth > 2) return reject("pipeline.queue_depth", "must be 1 or 2");
  if (cfg.transport.output.empty()) return reject("transport.output", "must not be empty");
  if (cfg.strip.output == StripOutputType::Ddp && (cfg.strip.host.empty() || cfg.strip.port == 0)) {
    return reject("strip.host/port", "are required for the ddp output");
  }
  esp_log_level_t level = ESP_LOG_INFO;
  if (log_level_parse(cfg.log_level, level) != ESP_OK) {
    return reject("log_level", "must be none, error, warn, info, debug or verbose");
  }
  return ESP_OK;
}

esp_err_t log_level_parse(const std::string& value, esp_log_level_t& out) {
  if (value == "none") {
    out = ESP_LOG_NONE;
  } else if (value == "error") {
    out = ESP_LOG_ERROR;
  } else if (value == "warn" || value == "warning") {
    out = ESP_LOG_WARN;
  } else if (value == "info") {
    out = ESP_LOG_INFO;
  } else if (value == "debug") {
    out = ESP_LOG_DEBUG;
  } else if (value == "verbose") {
    out = ESP_LOG_VERBOSE;
  } else {
    return ESP_ERR_INVALID_ARG;
  }
  return ESP_OK;
}

esp_log_level_t log_level_from_string(const std::string& value) {
  esp_log_level_t level = ESP_LOG_INFO;
  log_level_parse(value, level);
  return level;
}

const char* color_strategy_to_string(ColorStrategyType type) {
  switch (type) {
    case ColorStrategyType::Rainbow:
      return "rainbow";
    case ColorStrategyType::HueGroups:
      return "hue_groups";
    case ColorStrategyType::SingleHue:
      return "single_hue";
  }
  return "rainbow";
}

const char* pipeline_mode_to_string(PipelineMode mode) {
  return mode == PipelineMode::Sync ? "sync" : "threaded";
}

const char* wire_mode_to_string(WireMode mode) {
  return mode == WireMode::Bands ? "bands" : "rgb";
}

const char* strip_output_to_string(StripOutputType type) {
  return type == StripOutputType::Ddp ? "ddp" : "log";
}
