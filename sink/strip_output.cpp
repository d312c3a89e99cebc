#include "strip_output.hpp"
#include "esp_log.h"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>
#include <utility>

static const char* TAG = "strip";

#pragma pack(push, 1)
struct DDPHeader {
  uint8_t flags;         // version 1, push on the last packet of a frame
  uint8_t seq;           // 1..15, 0 = unused
  uint8_t data_type;     // RGB, 8 bit per channel
  uint8_t id;            // 1 = default display
  uint32_t data_offset;  // byte offset of this payload in the frame
  uint16_t data_len;     // payload bytes
};
#pragma pack(pop)

static_assert(sizeof(DDPHeader) == DDP_HEADER_LEN, "DDP header must be 10 bytes");

esp_err_t LogStripOutput::show(const PixelFrame& frame) {
  ++frames_;
  if (esp_log_level_get(TAG) < ESP_LOG_DEBUG) {
    return ESP_OK;
  }
  std::string text;
  text.reserve(frame.pixels.size() * 12);
  char buf[16];
  for (const Rgb8& px : frame.pixels) {
    snprintf(buf, sizeof(buf), " %02x%02x%02x", px.r, px.g, px.b);
    text += buf;
  }
  ESP_LOGD(TAG, "frame %llu:%s", static_cast<unsigned long long>(frame.seq), text.c_str());
  return ESP_OK;
}

void ddp_build_packets(const PixelFrame& frame, uint8_t seq, std::vector<std::vector<uint8_t>>& out) {
  out.clear();
  const size_t total = frame.pixels.size() * 3;
  size_t offset = 0;
  do {
    const size_t len = std::min<size_t>(DDP_MAX_PAYLOAD, total - offset);
    std::vector<uint8_t> pkt(sizeof(DDPHeader) + len);
    auto* h = reinterpret_cast<DDPHeader*>(pkt.data());
    const bool last = offset + len >= total;
    h->flags = static_cast<uint8_t>(DDP_FLAGS_VER1 | (last ? DDP_FLAGS_PUSH : 0));
    h->seq = static_cast<uint8_t>(seq & 0x0F);
    h->data_type = DDP_TYPE_RGB24;
    h->id = DDP_ID_DISPLAY;
    h->data_offset = htonl(static_cast<uint32_t>(offset));
    h->data_len = htons(static_cast<uint16_t>(len));
    uint8_t* p = pkt.data() + sizeof(DDPHeader);
    for (size_t i = offset; i < offset + len; ++i) {
      const Rgb8& px = frame.pixels[i / 3];
      *p++ = i % 3 == 0 ? px.r : (i % 3 == 1 ? px.g : px.b);
    }
    out.push_back(std::move(pkt));
    offset += len;
  } while (offset < total);
}

DdpStripOutput::~DdpStripOutput() {
  close();
}

esp_err_t DdpStripOutput::open() {
  struct addrinfo hints = {};
  hints.ai_family = AF_INET;
  hints.ai_socktype = SOCK_DGRAM;
  struct addrinfo* res = nullptr;
  char port_str[8];
  snprintf(port_str, sizeof(port_str), "%u", static_cast<unsigned>(port_));

  const int err = getaddrinfo(host_.c_str(), port_str, &hints, &res);
  if (err != 0 || !res) {
    ESP_LOGE(TAG, "Failed to resolve %s (%s)", host_.c_str(), gai_strerror(err));
    return ESP_ERR_NOT_FOUND;
  }
  sock_ = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
  if (sock_ < 0) {
    ESP_LOGE(TAG, "Unable to create UDP socket: %s", strerror(errno));
    freeaddrinfo(res);
    return ESP_FAIL;
  }
  const auto* raw = reinterpret_cast<const uint8_t*>(res->ai_addr);
  addr_.assign(raw, raw + res->ai_addrlen);
  freeaddrinfo(res);
  ESP_LOGI(TAG, "DDP output -> %s:%u", host_.c_str(), static_cast<unsigned>(port_));
  return ESP_OK;
}

esp_err_t DdpStripOutput::show(const PixelFrame& frame) {
  if (sock_ < 0) {
    return ESP_ERR_INVALID_STATE;
  }
  seq_ = static_cast<uint8_t>(seq_ % 15 + 1);
  ddp_build_packets(frame, seq_, packets_);
  for (const auto& pkt : packets_) {
    const ssize_t sent = sendto(sock_, pkt.data(), pkt.size(), 0, reinterpret_cast<const sockaddr*>(addr_.data()),
                                static_cast<socklen_t>(addr_.size()));
    if (sent < 0) {
      ESP_LOGW(TAG, "DDP send error -> %s:%u: %s", host_.c_str(), static_cast<unsigned>(port_), strerror(errno));
      return ESP_FAIL;
    }
  }
  return ESP_OK;
}

void DdpStripOutput::close() {
  if (sock_ >= 0) {
    ::close(sock_);
    sock_ = -1;
  }
}

esp_err_t strip_output_create(const StripConfig& cfg, std::unique_ptr<StripOutput>& out) {
  switch (cfg.output) {
    case StripOutputType::Ddp:
      if (cfg.host.empty()) {
        ESP_LOGE(TAG, "DDP output needs strip.host");
        return ESP_ERR_INVALID_ARG;
      }
      out = std::make_unique<DdpStripOutput>(cfg.host, cfg.port);
      return ESP_OK;
    case StripOutputType::Log:
      break;
  }
  out = std::make_unique<LogStripOutput>();
  return ESP_OK;
}
