#include "light_organ/frame_sink.hpp"
#include "esp_log.h"
#include "light_organ/config.hpp"
#include "light_organ/errors.hpp"
#include "light_organ/wire_codec.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

static const char* TAG = "transport";

LineFrameSink::LineFrameSink(int fd, bool owns_fd, WireMode wire, size_t led_count, size_t band_count)
    : fd_(fd), owns_fd_(owns_fd), wire_(wire), led_count_(led_count), band_count_(band_count) {
  // A vanished reader must surface as EPIPE, not kill the process.
  signal(SIGPIPE, SIG_IGN);
}

LineFrameSink::~LineFrameSink() {
  close();
}

esp_err_t LineFrameSink::emit(const PixelFrame& pixels, const BandEnergy& bands) {
  if (wire_ == WireMode::Bands) {
    return write_line(wire_encode_bands(bands));
  }
  return write_line(wire_encode_pixels(pixels));
}

esp_err_t LineFrameSink::emit_idle() {
  const size_t count = wire_ == WireMode::Bands ? band_count_ : led_count_ * 3;
  return write_line(wire_encode_zeros(count));
}

void LineFrameSink::close() {
  if (owns_fd_ && fd_ >= 0) {
    ::close(fd_);
  }
  fd_ = -1;
  closed_ = true;
}

esp_err_t LineFrameSink::write_line(const std::string& line) {
  if (closed_ || fd_ < 0) {
    return ORGAN_ERR_TRANSPORT_CLOSED;
  }
  const char* p = line.data();
  size_t left = line.size();
  while (left > 0) {
    const ssize_t n = ::write(fd_, p, left);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == EPIPE || errno == ECONNRESET) {
        ESP_LOGW(TAG, "Consumer closed the stream");
      } else {
        ESP_LOGE(TAG, "write failed: %s", strerror(errno));
      }
      closed_ = true;
      return ORGAN_ERR_TRANSPORT_CLOSED;
    }
    if (n == 0) {
      ESP_LOGW(TAG, "Zero-length write, treating stream as closed");
      closed_ = true;
      return ORGAN_ERR_TRANSPORT_CLOSED;
    }
    p += n;
    left -= static_cast<size_t>(n);
  }
  ++lines_written_;
  return ESP_OK;
}

esp_err_t frame_sink_open(const OrganConfig& cfg, std::unique_ptr<FrameSink>& out) {
  const std::string& target = cfg.transport.output;
  int fd = STDOUT_FILENO;
  bool owns = false;
  if (!target.empty() && target != "-") {
    // Blocks until a reader opens the other end when target is a FIFO.
    fd = ::open(target.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd < 0) {
      ESP_LOGE(TAG, "Cannot open %s: %s", target.c_str(), strerror(errno));
      return ORGAN_ERR_TRANSPORT_CLOSED;
    }
    owns = true;
  }
  ESP_LOGI(TAG, "Writing %s frames to %s", wire_mode_to_string(cfg.transport.wire),
           owns ? target.c_str() : "stdout");
  out = std::make_unique<LineFrameSink>(fd, owns, cfg.transport.wire, cfg.led_count, cfg.analysis.bands);
  return ESP_OK;
}
