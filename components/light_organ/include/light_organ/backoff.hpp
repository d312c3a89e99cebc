#pragma once
#include <cstdint>

// Bounded exponential backoff for device reopen attempts.
class Backoff {
 public:
  static constexpr uint32_t kBaseMs = 100;
  static constexpr uint32_t kCapMs = 5000;

  explicit Backoff(uint32_t max_attempts, uint32_t base_ms = kBaseMs, uint32_t cap_ms = kCapMs)
      : max_attempts_(max_attempts), base_ms_(base_ms), cap_ms_(cap_ms) {}

  // Delay before the next attempt; false once max_attempts are used up.
  bool next(uint32_t& delay_ms) {
    if (attempts_ >= max_attempts_) {
      return false;
    }
    uint64_t delay = base_ms_;
    for (uint32_t i = 0; i < attempts_ && delay < cap_ms_; ++i) {
      delay *= 2;
    }
    delay_ms = static_cast<uint32_t>(delay < cap_ms_ ? delay : cap_ms_);
    ++attempts_;
    return true;
  }

  void reset() { attempts_ = 0; }
  uint32_t attempts() const { return attempts_; }
  bool exhausted() const { return attempts_ >= max_attempts_; }

 private:
  uint32_t max_attempts_;
  uint32_t base_ms_;
  uint32_t cap_ms_;
  uint32_t attempts_{0};
};
