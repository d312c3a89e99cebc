#pragma once
#include "esp_err.h"
#include "light_organ/types.hpp"
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

// Bounded hand-off between the capture and analysis tasks. A full queue drops
// its oldest block so the consumer always sees the freshest audio.
class BlockQueue {
 public:
  explicit BlockQueue(size_t depth);

  // Returns true when an older block had to be dropped to make room.
  bool push(SampleBlock&& block);

  // ESP_OK with a block, ESP_ERR_TIMEOUT when nothing arrived in time,
  // ORGAN_ERR_END_OF_STREAM once closed and drained.
  esp_err_t pop(SampleBlock& out, uint32_t timeout_ms);

  // Waits until a push would not drop anything. Used by producers that are not
  // paced by hardware. False on timeout or once closed.
  bool wait_for_space(uint32_t timeout_ms);

  // Discards pending blocks without counting them as drops. Returns how many.
  size_t clear();

  // Producer is done; pending blocks can still be popped.
  void close();

  bool closed() const;
  size_t size() const;
  size_t depth() const { return depth_; }
  uint64_t dropped() const;

 private:
  const size_t depth_;
  mutable std::mutex mutex_;
  std::condition_variable ready_;
  std::condition_variable space_;
  std::deque<SampleBlock> blocks_;
  uint64_t dropped_{0};
  bool closed_{false};
};
