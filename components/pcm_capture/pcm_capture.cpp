#include "pcm_capture.hpp"
#include "esp_log.h"
#include "light_organ/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>
#include <utility>

static const char* TAG = "capture";

namespace {

constexpr size_t kReadChunk = 4096;
// Audio a live producer may hold back before a shortfall counts as loss
// (arecord delivers 125 ms periods out of a 500 ms buffer).
constexpr int64_t kLossToleranceUs = 500000;
constexpr int64_t kMinLossToleranceBlocks = 2;

int connect_tcp(const std::string& host, uint16_t port) {
  struct addrinfo hints = {};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  struct addrinfo* res = nullptr;
  char port_str[8];
  snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(port));
  const int err = getaddrinfo(host.c_str(), port_str, &hints, &res);
  if (err != 0 || !res) {
    ESP_LOGE(TAG, "resolve failed %s:%s (%s)", host.c_str(), port_str, gai_strerror(err));
    return -1;
  }
  int sock = -1;
  for (struct addrinfo* ai = res; ai; ai = ai->ai_next) {
    sock = socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (sock < 0) {
      continue;
    }
    if (connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
      break;
    }
    close(sock);
    sock = -1;
  }
  if (sock < 0) {
    ESP_LOGE(TAG, "connect failed %s:%s: %s", host.c_str(), port_str, strerror(errno));
  }
  freeaddrinfo(res);
  return sock;
}

}  // namespace

StreamSampleSource::StreamSampleSource(size_t block_samples, uint32_t sample_rate, CaptureClockFn now)
    : block_bytes_(block_samples * sizeof(int16_t)),
      sample_rate_(sample_rate),
      period_us_(sample_rate > 0 ? static_cast<int64_t>(block_samples) * 1'000'000 / sample_rate : 0),
      now_(now),
      loss_tolerance_blocks_(
          period_us_ > 0 ? std::max(kMinLossToleranceBlocks, kLossToleranceUs / period_us_) : 0) {
  pending_.reserve(block_bytes_ + kReadChunk);
}

StreamSampleSource::~StreamSampleSource() {
  close();
}

esp_err_t StreamSampleSource::open() {
  if (fd_ >= 0) {
    return ESP_OK;
  }
  Device dev{};
  const esp_err_t err = open_device(dev);
  if (err != ESP_OK) {
    return err;
  }
  fd_ = dev.fd;
  owned_ = dev.owned;
  eof_is_end_ = dev.eof_is_end;
  live_ = dev.live;
  anchored_ = false;
  pending_.clear();
  ESP_LOGI(TAG, "Capturing from %s (%u bytes per block, %s)", describe().c_str(),
           static_cast<unsigned>(block_bytes_), live_ ? "live" : "finite");
  return ESP_OK;
}

void StreamSampleSource::close() {
  if (fd_ >= 0 && owned_) {
    ::close(fd_);
  }
  fd_ = -1;
  pending_.clear();
}

esp_err_t StreamSampleSource::fill(uint32_t timeout_ms) {
  uint8_t chunk[kReadChunk];
  while (pending_.size() < block_bytes_) {
    struct pollfd pfd = {};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int ready = poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (ready == 0) {
      return ESP_ERR_TIMEOUT;
    }
    if (ready < 0) {
      if (errno == EINTR) {
        return ESP_ERR_TIMEOUT;
      }
      ESP_LOGE(TAG, "poll on %s failed: %s", describe().c_str(), strerror(errno));
      return ORGAN_ERR_DEVICE;
    }
    const size_t want = std::min(sizeof(chunk), block_bytes_ - pending_.size());
    const ssize_t n = ::read(fd_, chunk, want);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      ESP_LOGE(TAG, "read from %s failed: %s", describe().c_str(), strerror(errno));
      return ORGAN_ERR_DEVICE;
    }
    if (n == 0) {
      if (eof_is_end_) {
        if (!pending_.empty()) {
          ESP_LOGD(TAG, "Discarding %u trailing bytes", static_cast<unsigned>(pending_.size()));
        }
        ESP_LOGI(TAG, "End of input on %s", describe().c_str());
        return ORGAN_ERR_END_OF_STREAM;
      }
      ESP_LOGW(TAG, "%s closed by the other side", describe().c_str());
      return ORGAN_ERR_DEVICE;
    }
    pending_.insert(pending_.end(), chunk, chunk + n);
  }
  return ESP_OK;
}

uint32_t StreamSampleSource::count_lost(int64_t now_us) {
  if (!live_ || period_us_ <= 0) {
    return 0;
  }
  if (!anchored_) {
    anchored_ = true;
    anchor_us_ = now_us;
    anchor_seq_ = next_seq_;
    return 0;
  }
  // Blocks that should have completed since the anchor versus blocks accounted
  // for. Bursty producers run ahead and then behind by up to their buffer.
  const int64_t due = (now_us - anchor_us_) / period_us_;
  const int64_t accounted = static_cast<int64_t>(next_seq_ - anchor_seq_);
  if (accounted > due) {
    anchor_us_ = now_us - accounted * period_us_;
    return 0;
  }
  const int64_t behind = due - accounted;
  if (behind <= loss_tolerance_blocks_) {
    return 0;
  }
  return static_cast<uint32_t>(behind);
}

esp_err_t StreamSampleSource::next_block(SampleBlock& out, uint32_t timeout_ms) {
  if (fd_ < 0) {
    return ORGAN_ERR_DEVICE;
  }
  const esp_err_t err = fill(timeout_ms);
  if (err == ESP_ERR_TIMEOUT) {
    return err;
  }
  if (err != ESP_OK) {
    close();
    return err;
  }

  const int64_t now_us = now_ ? now_() : 0;
  const uint32_t lost = count_lost(now_us);
  if (lost > 0) {
    ESP_LOGW(TAG, "%u block(s) lost on %s", static_cast<unsigned>(lost), describe().c_str());
    next_seq_ += lost;
    blocks_lost_ += lost;
  }

  const size_t samples = block_bytes_ / sizeof(int16_t);
  out.seq = next_seq_++;
  out.sample_rate = sample_rate_;
  out.timestamp_us = now_us;
  out.dropped_before = lost;
  out.samples.resize(samples);
  for (size_t i = 0; i < samples; ++i) {
    const uint16_t lo = pending_[2 * i];
    const uint16_t hi = pending_[2 * i + 1];
    out.samples[i] = static_cast<int16_t>(lo | (hi << 8));
  }
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(block_bytes_));
  return ESP_OK;
}

FdSampleSource::FdSampleSource(std::string path, size_t block_samples, uint32_t sample_rate, CaptureClockFn now)
    : StreamSampleSource(block_samples, sample_rate, now), path_(std::move(path)) {}

std::string FdSampleSource::describe() const {
  return is_stdin() ? std::string("stdin") : path_;
}

esp_err_t FdSampleSource::open_device(Device& dev) {
  if (is_stdin()) {
    dev.fd = STDIN_FILENO;
    dev.owned = false;
    dev.eof_is_end = true;
    struct stat st = {};
    dev.live = fstat(STDIN_FILENO, &st) == 0 && !S_ISREG(st.st_mode);
    return ESP_OK;
  }
  const int fd = ::open(path_.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    ESP_LOGE(TAG, "Cannot open %s: %s", path_.c_str(), strerror(errno));
    return ORGAN_ERR_DEVICE;
  }
  struct stat st = {};
  if (fstat(fd, &st) != 0) {
    ESP_LOGE(TAG, "Cannot stat %s: %s", path_.c_str(), strerror(errno));
    ::close(fd);
    return ORGAN_ERR_DEVICE;
  }
  if (S_ISDIR(st.st_mode)) {
    ESP_LOGE(TAG, "%s is a directory", path_.c_str());
    ::close(fd);
    return ORGAN_ERR_DEVICE;
  }
  dev.fd = fd;
  dev.owned = true;
  dev.eof_is_end = S_ISREG(st.st_mode);
  dev.live = !dev.eof_is_end;
  return ESP_OK;
}

TcpSampleSource::TcpSampleSource(std::string host, uint16_t port, size_t block_samples, uint32_t sample_rate,
                                 CaptureClockFn now)
    : StreamSampleSource(block_samples, sample_rate, now), host_(std::move(host)), port_(port) {}

std::string TcpSampleSource::describe() const {
  return "tcp://" + host_ + ":" + std::to_string(port_);
}

esp_err_t TcpSampleSource::open_device(Device& dev) {
  const int sock = connect_tcp(host_, port_);
  if (sock < 0) {
    return ORGAN_ERR_DEVICE;
  }
  ESP_LOGI(TAG, "Connected to %s (raw PCM expected)", describe().c_str());
  dev.fd = sock;
  dev.owned = true;
  dev.eof_is_end = false;
  dev.live = true;
  return ESP_OK;
}

esp_err_t pcm_capture_parse_tcp(const std::string& device, std::string& host, uint16_t& port) {
  static const char kScheme[] = "tcp://";
  if (device.compare(0, sizeof(kScheme) - 1, kScheme) != 0) {
    return ESP_ERR_INVALID_ARG;
  }
  const std::string rest = device.substr(sizeof(kScheme) - 1);
  const size_t colon = rest.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 >= rest.size()) {
    return ESP_ERR_INVALID_ARG;
  }
  const std::string port_str = rest.substr(colon + 1);
  char* end = nullptr;
  const long value = strtol(port_str.c_str(), &end, 10);
  if (!end || *end != '\0' || value < 1 || value > 65535) {
    return ESP_ERR_INVALID_ARG;
  }
  host = rest.substr(0, colon);
  if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  port = static_cast<uint16_t>(value);
  return ESP_OK;
}

esp_err_t pcm_capture_create(const CaptureConfig& cfg, CaptureClockFn now, std::unique_ptr<SampleSource>& out) {
  const size_t block = block_size_for(cfg);
  if (block == 0 || cfg.device.empty()) {
    return ESP_ERR_INVALID_ARG;
  }
  if (cfg.device.rfind("tcp://", 0) == 0) {
    std::string host;
    uint16_t port = 0;
    if (pcm_capture_parse_tcp(cfg.device, host, port) != ESP_OK) {
      ESP_LOGE(TAG, "Invalid TCP capture device '%s'", cfg.device.c_str());
      return ESP_ERR_INVALID_ARG;
    }
    out = std::make_unique<TcpSampleSource>(host, port, block, cfg.sample_rate, now);
    return ESP_OK;
  }
  out = std::make_unique<FdSampleSource>(cfg.device, block, cfg.sample_rate, now);
  return ESP_OK;
}
