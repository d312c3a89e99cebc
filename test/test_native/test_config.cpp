/**
 * Configuration: defaults, JSON decoding, validation and serialization.
 */

#include <unity.h>
#include "light_organ/config.hpp"
#include <cstdlib>
#include <cstring>
#include <string>

static esp_err_t apply(OrganConfig& cfg, const char* json) {
  return config_apply_json(cfg, json, strlen(json));
}

static void test_defaults_are_valid(void) {
  OrganConfig cfg{};
  config_reset_defaults(cfg);
  TEST_ASSERT_EQUAL(ESP_OK, config_validate(cfg));
  TEST_ASSERT_EQUAL_UINT16(9, cfg.led_count);
  TEST_ASSERT_EQUAL_UINT16(2048, cfg.analysis.fft_size);
  TEST_ASSERT_EQUAL_UINT16(9, cfg.analysis.bands);
  TEST_ASSERT_EQUAL_FLOAT(250.0f, cfg.analysis.low_hz);
  TEST_ASSERT_EQUAL_FLOAT(4000.0f, cfg.analysis.high_hz);
  TEST_ASSERT_EQUAL_FLOAT(0.995f, cfg.analysis.decay);
  TEST_ASSERT_TRUE(cfg.pipeline.mode == PipelineMode::Threaded);
  TEST_ASSERT_EQUAL_STRING("-", cfg.capture.device.c_str());
}

static void test_block_size_follows_update_rate(void) {
  CaptureConfig cap{};
  TEST_ASSERT_EQUAL_UINT32(735, block_size_for(cap));
  cap.update_hz = 30.0f;
  TEST_ASSERT_EQUAL_UINT32(1470, block_size_for(cap));
  cap.update_hz = 0.0f;
  TEST_ASSERT_EQUAL_UINT32(0, block_size_for(cap));
}

static void test_json_overrides_fields(void) {
  OrganConfig cfg{};
  const char* json =
      "{\"led_count\":6,\"capture\":{\"device\":\"tcp://snap.local:4953\",\"delay_ms\":250},"
      "\"analysis\":{\"bands\":12,\"low_hz\":100},"
      "\"mapper\":{\"strategy\":\"hue_groups\",\"gamma\":2.2},"
      "\"pipeline\":{\"mode\":\"sync\",\"queue_depth\":1},"
      "\"transport\":{\"wire\":\"bands\"},"
      "\"strip\":{\"output\":\"ddp\",\"host\":\"wled.local\"}}";
  TEST_ASSERT_EQUAL(ESP_OK, apply(cfg, json));
  TEST_ASSERT_EQUAL_UINT16(6, cfg.led_count);
  TEST_ASSERT_EQUAL_STRING("tcp://snap.local:4953", cfg.capture.device.c_str());
  TEST_ASSERT_EQUAL_UINT32(250, cfg.capture.delay_ms);
  TEST_ASSERT_EQUAL_UINT16(12, cfg.analysis.bands);
  TEST_ASSERT_EQUAL_FLOAT(100.0f, cfg.analysis.low_hz);
  TEST_ASSERT_EQUAL_FLOAT(4000.0f, cfg.analysis.high_hz);
  TEST_ASSERT_TRUE(cfg.mapper.strategy == ColorStrategyType::HueGroups);
  TEST_ASSERT_FLOAT_WITHIN(1e-5f, 2.2f, cfg.mapper.gamma);
  TEST_ASSERT_TRUE(cfg.pipeline.mode == PipelineMode::Sync);
  TEST_ASSERT_EQUAL_UINT8(1, cfg.pipeline.queue_depth);
  TEST_ASSERT_TRUE(cfg.transport.wire == WireMode::Bands);
  TEST_ASSERT_TRUE(cfg.strip.output == StripOutputType::Ddp);
  TEST_ASSERT_EQUAL(ESP_OK, config_validate(cfg));
}

static void test_wrong_types_and_unknown_keys_are_ignored(void) {
  OrganConfig cfg{};
  TEST_ASSERT_EQUAL(ESP_OK, apply(cfg, "{\"led_count\":\"many\",\"colour\":3,\"capture\":7}"));
  TEST_ASSERT_EQUAL_UINT16(9, cfg.led_count);
  TEST_ASSERT_EQUAL_STRING("-", cfg.capture.device.c_str());
}

static void test_unknown_enum_value_is_rejected(void) {
  OrganConfig cfg{};
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, apply(cfg, "{\"mapper\":{\"strategy\":\"strobe\"}}"));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, apply(cfg, "{\"transport\":{\"wire\":\"binary\"}}"));
}

static void test_broken_json_is_rejected(void) {
  OrganConfig cfg{};
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, apply(cfg, "{\"led_count\":"));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, apply(cfg, "[1,2,3]"));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_apply_json(cfg, nullptr, 0));
}

static void test_validation_rejects_zero_leds(void) {
  OrganConfig cfg{};
  cfg.led_count = 0;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));
}

static void test_validation_rejects_inverted_cutoffs(void) {
  OrganConfig cfg{};
  cfg.analysis.low_hz = 4000.0f;
  cfg.analysis.high_hz = 250.0f;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));

  cfg = OrganConfig{};
  cfg.analysis.high_hz = 30000.0f;  // above Nyquist for 44.1 kHz
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));
}

static void test_validation_rejects_bad_fft_size(void) {
  OrganConfig cfg{};
  cfg.analysis.fft_size = 1000;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));
  cfg.analysis.fft_size = 128;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));
  // 735-sample blocks do not fit a 512-point frame.
  cfg.analysis.fft_size = 512;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));
}

static void test_validation_rejects_out_of_range_fields(void) {
  OrganConfig cfg{};
  cfg.analysis.decay = 1.0f;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));

  cfg = OrganConfig{};
  cfg.pipeline.queue_depth = 3;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));

  cfg = OrganConfig{};
  cfg.mapper.saturation = 1.5f;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));

  cfg = OrganConfig{};
  cfg.strip.output = StripOutputType::Ddp;
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));

  OrganConfig negative{};
  TEST_ASSERT_EQUAL(ESP_OK, apply(negative, "{\"capture\":{\"sample_rate\":-44100}}"));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(negative));
}

static void test_validation_rejects_unknown_log_level(void) {
  OrganConfig cfg{};
  cfg.log_level = "loud";
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, config_validate(cfg));
  cfg.log_level = "warning";
  TEST_ASSERT_EQUAL(ESP_OK, config_validate(cfg));

  esp_log_level_t level = ESP_LOG_NONE;
  TEST_ASSERT_EQUAL(ESP_OK, log_level_parse("info", level));
  TEST_ASSERT_EQUAL(ESP_LOG_INFO, level);
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_ARG, log_level_parse("INFO", level));
  TEST_ASSERT_EQUAL(ESP_LOG_INFO, level);
}

static void test_json_round_trip(void) {
  OrganConfig cfg{};
  cfg.led_count = 60;
  cfg.capture.device = "/dev/audio_fifo";
  cfg.capture.update_hz = 50.0f;
  cfg.analysis.bands = 16;
  cfg.analysis.coupling = 0.5f;
  cfg.mapper.strategy = ColorStrategyType::SingleHue;
  cfg.mapper.hue = 200.0f;
  cfg.mapper.brightness = 128;
  cfg.pipeline.mode = PipelineMode::Sync;
  cfg.transport.wire = WireMode::Bands;
  cfg.strip.host = "10.0.0.7";
  cfg.strip.port = 4049;

  const std::string json = config_to_json(cfg);
  OrganConfig back{};
  TEST_ASSERT_EQUAL(ESP_OK, config_apply_json(back, json.data(), json.size()));
  TEST_ASSERT_EQUAL_UINT16(cfg.led_count, back.led_count);
  TEST_ASSERT_EQUAL_STRING(cfg.capture.device.c_str(), back.capture.device.c_str());
  TEST_ASSERT_EQUAL_FLOAT(cfg.capture.update_hz, back.capture.update_hz);
  TEST_ASSERT_EQUAL_UINT16(cfg.analysis.bands, back.analysis.bands);
  TEST_ASSERT_EQUAL_FLOAT(cfg.analysis.coupling, back.analysis.coupling);
  TEST_ASSERT_EQUAL_FLOAT(cfg.analysis.decay, back.analysis.decay);
  TEST_ASSERT_EQUAL_FLOAT(cfg.analysis.floor, back.analysis.floor);
  TEST_ASSERT_TRUE(back.mapper.strategy == ColorStrategyType::SingleHue);
  TEST_ASSERT_EQUAL_FLOAT(200.0f, back.mapper.hue);
  TEST_ASSERT_EQUAL_UINT8(128, back.mapper.brightness);
  TEST_ASSERT_TRUE(back.pipeline.mode == PipelineMode::Sync);
  TEST_ASSERT_TRUE(back.transport.wire == WireMode::Bands);
  TEST_ASSERT_EQUAL_STRING("10.0.0.7", back.strip.host.c_str());
  TEST_ASSERT_EQUAL_UINT16(4049, back.strip.port);
}

static void test_load_reads_environment(void) {
  setenv(LIGHT_ORGAN_CONFIG_ENV, "{\"led_count\":30,\"log_level\":\"debug\"}", 1);
  unsetenv(LIGHT_ORGAN_CONFIG_FILE_ENV);
  OrganConfig cfg{};
  cfg.led_count = 1000;
  TEST_ASSERT_EQUAL(ESP_OK, config_load(cfg));
  TEST_ASSERT_EQUAL_UINT16(30, cfg.led_count);
  TEST_ASSERT_EQUAL_STRING("debug", cfg.log_level.c_str());
  TEST_ASSERT_EQUAL(ESP_LOG_DEBUG, log_level_from_string(cfg.log_level));

  setenv(LIGHT_ORGAN_CONFIG_FILE_ENV, "/nonexistent/light_organ.json", 1);
  TEST_ASSERT_EQUAL(ESP_ERR_NOT_FOUND, config_load(cfg));
  unsetenv(LIGHT_ORGAN_CONFIG_FILE_ENV);
  unsetenv(LIGHT_ORGAN_CONFIG_ENV);
}

void run_config_tests() {
  RUN_TEST(test_defaults_are_valid);
  RUN_TEST(test_block_size_follows_update_rate);
  RUN_TEST(test_json_overrides_fields);
  RUN_TEST(test_wrong_types_and_unknown_keys_are_ignored);
  RUN_TEST(test_unknown_enum_value_is_rejected);
  RUN_TEST(test_broken_json_is_rejected);
  RUN_TEST(test_validation_rejects_zero_leds);
  RUN_TEST(test_validation_rejects_inverted_cutoffs);
  RUN_TEST(test_validation_rejects_bad_fft_size);
  RUN_TEST(test_validation_rejects_out_of_range_fields);
  RUN_TEST(test_validation_rejects_unknown_log_level);
  RUN_TEST(test_json_round_trip);
  RUN_TEST(test_load_reads_environment);
}
