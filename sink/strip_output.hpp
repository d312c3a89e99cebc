#pragma once

#include "esp_err.h"
#include "light_organ/types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

// Consumer side of the pipe: where decoded PixelFrames end up.
class StripOutput {
 public:
  virtual ~StripOutput() = default;
  virtual esp_err_t open() = 0;
  virtual esp_err_t show(const PixelFrame& frame) = 0;
  virtual void close() = 0;
  virtual const char* name() const = 0;
};

// Dry run: every frame is logged at debug level.
class LogStripOutput : public StripOutput {
 public:
  esp_err_t open() override { return ESP_OK; }
  esp_err_t show(const PixelFrame& frame) override;
  void close() override {}
  const char* name() const override { return "log"; }

  uint64_t frames_shown() const { return frames_; }

 private:
  uint64_t frames_{0};
};

// DDP over UDP to a network LED controller (WLED and similar).
class DdpStripOutput : public StripOutput {
 public:
  DdpStripOutput(std::string host, uint16_t port) : host_(std::move(host)), port_(port) {}
  ~DdpStripOutput() override;

  DdpStripOutput(const DdpStripOutput&) = delete;
  DdpStripOutput& operator=(const DdpStripOutput&) = delete;

  esp_err_t open() override;
  esp_err_t show(const PixelFrame& frame) override;
  void close() override;
  const char* name() const override { return "ddp"; }

 private:
  std::string host_;
  uint16_t port_;
  int sock_{-1};
  std::vector<uint8_t> addr_{};
  uint8_t seq_{0};
  std::vector<std::vector<uint8_t>> packets_{};
};

#define DDP_HEADER_LEN 10
#define DDP_MAX_PAYLOAD 1440  // 480 RGB pixels
#define DDP_FLAGS_VER1 0x40
#define DDP_FLAGS_PUSH 0x01
#define DDP_TYPE_RGB24 0x0B
#define DDP_ID_DISPLAY 1

// Splits frame into DDP packets of at most DDP_MAX_PAYLOAD bytes; only the last
// one carries the push flag. seq is the 1..15 sequence nibble.
void ddp_build_packets(const PixelFrame& frame, uint8_t seq, std::vector<std::vector<uint8_t>>& out);

esp_err_t strip_output_create(const StripConfig& cfg, std::unique_ptr<StripOutput>& out);
