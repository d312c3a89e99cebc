#pragma once

#include "esp_err.h"
#include "light_organ/types.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// Raw S16_LE mono PCM capture. Sources hand out fixed-size SampleBlocks with
// consecutive sequence numbers; blocks known to be lost show up as a sequence
// gap and in SampleBlock::dropped_before.

// Monotonic microsecond clock (esp_timer_get_time in the app).
using CaptureClockFn = int64_t (*)();

class SampleSource {
 public:
  virtual ~SampleSource() = default;

  // ORGAN_ERR_DEVICE when the device cannot be opened.
  virtual esp_err_t open() = 0;

  // Waits up to timeout_ms for the next complete block. ESP_ERR_TIMEOUT leaves
  // partial data buffered for the next call. ORGAN_ERR_END_OF_STREAM when a
  // finite input ended, ORGAN_ERR_DEVICE when the device failed; both close it.
  virtual esp_err_t next_block(SampleBlock& out, uint32_t timeout_ms) = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;
  // Paced by hardware (FIFO, device, socket) rather than readable at will.
  virtual bool is_live() const = 0;
  virtual std::string describe() const = 0;
};

// Shared reader for everything that ends up as a file descriptor.
class StreamSampleSource : public SampleSource {
 public:
  StreamSampleSource(size_t block_samples, uint32_t sample_rate, CaptureClockFn now);
  ~StreamSampleSource() override;

  StreamSampleSource(const StreamSampleSource&) = delete;
  StreamSampleSource& operator=(const StreamSampleSource&) = delete;

  esp_err_t open() override;
  esp_err_t next_block(SampleBlock& out, uint32_t timeout_ms) override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }
  bool is_live() const override { return live_; }

  uint64_t blocks_lost() const { return blocks_lost_; }

 protected:
  struct Device {
    int fd{-1};
    bool owned{true};       // close() closes fd
    bool eof_is_end{false}; // end of input is a clean end of stream
    bool live{false};       // paced by hardware; a shortfall against elapsed time counts as lost blocks
  };

  virtual esp_err_t open_device(Device& dev) = 0;

 private:
  esp_err_t fill(uint32_t timeout_ms);
  uint32_t count_lost(int64_t now_us);

  size_t block_bytes_;
  uint32_t sample_rate_;
  int64_t period_us_;
  CaptureClockFn now_;
  int64_t loss_tolerance_blocks_;
  int fd_{-1};
  bool owned_{true};
  bool eof_is_end_{false};
  bool live_{false};
  std::vector<uint8_t> pending_;
  uint64_t next_seq_{0};
  // Loss accounting anchor, set by the first block after open().
  bool anchored_{false};
  int64_t anchor_us_{0};
  uint64_t anchor_seq_{0};
  uint64_t blocks_lost_{0};
};

// "-" / "stdin" or a filesystem path.
class FdSampleSource : public StreamSampleSource {
 public:
  FdSampleSource(std::string path, size_t block_samples, uint32_t sample_rate, CaptureClockFn now);
  std::string describe() const override;

 protected:
  esp_err_t open_device(Device& dev) override;

 private:
  bool is_stdin() const { return path_ == "-" || path_ == "stdin"; }
  std::string path_;
};

// "tcp://host:port": raw PCM served by a Snapcast-style TCP stream.
class TcpSampleSource : public StreamSampleSource {
 public:
  TcpSampleSource(std::string host, uint16_t port, size_t block_samples, uint32_t sample_rate, CaptureClockFn now);
  std::string describe() const override;

 protected:
  esp_err_t open_device(Device& dev) override;

 private:
  std::string host_;
  uint16_t port_;
};

// Splits "tcp://host:port". ESP_ERR_INVALID_ARG when malformed.
esp_err_t pcm_capture_parse_tcp(const std::string& device, std::string& host, uint16_t& port);

// Builds the source for cfg.device without opening it.
esp_err_t pcm_capture_create(const CaptureConfig& cfg, CaptureClockFn now, std::unique_ptr<SampleSource>& out);
