#pragma once
#include "esp_err.h"
#include "esp_log.h"
#include "light_organ/types.hpp"
#include <string>

// Environment variables consulted by config_load(), in this order.
#define LIGHT_ORGAN_CONFIG_FILE_ENV "LIGHT_ORGAN_CONFIG_FILE"
#define LIGHT_ORGAN_CONFIG_ENV "LIGHT_ORGAN_CONFIG"

void config_reset_defaults(OrganConfig& cfg);
esp_err_t config_load(OrganConfig& cfg);
esp_err_t config_apply_json(OrganConfig& cfg, const char* data, size_t len);
std::string config_to_json(const OrganConfig& cfg);

// Checks every field once before the pipeline starts; logs the first offending field.
esp_err_t config_validate(const OrganConfig& cfg);

// ESP_ERR_INVALID_ARG for anything but none, error, warn(ing), info, debug, verbose.
esp_err_t log_level_parse(const std::string& value, esp_log_level_t& out);
// For a validated config; unknown names fall back to info.
esp_log_level_t log_level_from_string(const std::string& value);
const char* color_strategy_to_string(ColorStrategyType type);
const char* pipeline_mode_to_string(PipelineMode mode);
const char* wire_mode_to_string(WireMode mode);
const char* strip_output_to_string(StripOutputType type);
