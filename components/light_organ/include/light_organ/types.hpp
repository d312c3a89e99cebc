#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class ColorStrategyType {
  Rainbow,
  HueGroups,
  SingleHue,
};

enum class PipelineMode {
  Sync,
  Threaded,
};

enum class WireMode {
  Rgb,
  Bands,
};

enum class StripOutputType {
  Log,
  Ddp,
};

struct CaptureConfig {
  std::string device{"-"};
  uint32_t sample_rate{44100};
  float update_hz{60.0f};
  uint32_t delay_ms{0};
  uint16_t max_retries{8};
};

struct AnalysisConfig {
  uint16_t fft_size{2048};
  uint16_t bands{9};
  float low_hz{250.0f};
  float high_hz{4000.0f};
  float decay{0.995f};     // per-frame reference decay
  float coupling{0.25f};   // share of the loudest band reference every band is held to
  float floor{1e-4f};      // minimum reference (noise floor)
};

struct MapperConfig {
  ColorStrategyType strategy{ColorStrategyType::Rainbow};
  float hue{0.0f};
  float saturation{1.0f};
  float gamma{1.0f};
  uint8_t brightness{255};
};

struct PipelineConfig {
  PipelineMode mode{PipelineMode::Threaded};
  uint8_t queue_depth{2};
};

struct TransportConfig {
  std::string output{"-"};
  WireMode wire{WireMode::Rgb};
};

struct StripConfig {
  StripOutputType output{StripOutputType::Log};
  std::string host{};
  uint16_t port{4048};
};

struct OrganConfig {
  std::string log_level{"info"};
  uint16_t led_count{9};
  CaptureConfig capture{};
  AnalysisConfig analysis{};
  MapperConfig mapper{};
  PipelineConfig pipeline{};
  TransportConfig transport{};
  StripConfig strip{};
};

// Samples per SampleBlock: sample_rate / update_hz, rounded.
size_t block_size_for(const CaptureConfig& cfg);

struct SampleBlock {
  uint64_t seq{0};
  uint32_t sample_rate{0};
  int64_t timestamp_us{0};
  uint32_t dropped_before{0};  // blocks the source knows it lost right before this one
  std::vector<int16_t> samples{};
};

struct AnalysisFrame {
  uint64_t seq{0};
  bool primed{false};
  std::vector<float> samples{};
};

struct Spectrum {
  uint64_t seq{0};
  float bin_hz{0.0f};
  std::vector<float> magnitudes{};  // bins 0..N/2
};

struct BandEnergy {
  uint64_t seq{0};
  std::vector<uint8_t> values{};
};

struct Rgb8 {
  uint8_t r{0};
  uint8_t g{0};
  uint8_t b{0};
};

struct PixelFrame {
  uint64_t seq{0};
  std::vector<Rgb8> pixels{};
};
