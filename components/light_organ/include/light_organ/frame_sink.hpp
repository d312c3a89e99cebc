#pragma once
#include "esp_err.h"
#include "light_organ/types.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Transport end of the pipeline. emit() returns ORGAN_ERR_TRANSPORT_CLOSED once
// the consumer is gone; that error is final.
class FrameSink {
 public:
  virtual ~FrameSink() = default;
  virtual esp_err_t emit(const PixelFrame& pixels, const BandEnergy& bands) = 0;
  // All-zero frame: LEDs off.
  virtual esp_err_t emit_idle() = 0;
  virtual void close() = 0;
};

// Writes one wire line per frame straight to a file descriptor with write(2);
// nothing is buffered in user space.
class LineFrameSink : public FrameSink {
 public:
  LineFrameSink(int fd, bool owns_fd, WireMode wire, size_t led_count, size_t band_count);
  ~LineFrameSink() override;

  LineFrameSink(const LineFrameSink&) = delete;
  LineFrameSink& operator=(const LineFrameSink&) = delete;

  esp_err_t emit(const PixelFrame& pixels, const BandEnergy& bands) override;
  esp_err_t emit_idle() override;
  void close() override;

  uint64_t lines_written() const { return lines_written_; }

 private:
  esp_err_t write_line(const std::string& line);

  int fd_;
  bool owns_fd_;
  bool closed_{false};
  WireMode wire_;
  size_t led_count_;
  size_t band_count_;
  uint64_t lines_written_{0};
};

// Opens transport.output: "-" for stdout, otherwise a path (FIFO or file).
esp_err_t frame_sink_open(const OrganConfig& cfg, std::unique_ptr<FrameSink>& out);
