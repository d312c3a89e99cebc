#pragma once
#include "light_organ/types.hpp"
#include <cstdint>
#include <deque>

// Holds captured blocks for a fixed time so the lights line up with a delayed
// speaker. A zero delay releases every block immediately.
class DelayLine {
 public:
  explicit DelayLine(uint32_t delay_ms) : delay_us_(static_cast<int64_t>(delay_ms) * 1000) {}

  void push(SampleBlock&& block, int64_t now_us);

  // Moves the oldest block into out once its release time has passed.
  bool pop_ready(int64_t now_us, SampleBlock& out);

  // Moves the oldest block into out regardless of its release time.
  bool pop_any(SampleBlock& out);

  // Microseconds until the oldest block is due; -1 when empty.
  int64_t time_to_next(int64_t now_us) const;

  void clear() { pending_.clear(); }
  bool empty() const { return pending_.empty(); }
  size_t size() const { return pending_.size(); }
  int64_t delay_us() const { return delay_us_; }

 private:
  struct Entry {
    int64_t release_us;
    SampleBlock block;
  };

  int64_t delay_us_;
  std::deque<Entry> pending_;
};
