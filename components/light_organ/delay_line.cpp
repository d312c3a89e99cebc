#include "light_organ/delay_line.hpp"
#include <utility>

void DelayLine::push(SampleBlock&& block, int64_t now_us) {
  pending_.push_back(Entry{now_us + delay_us_, std::move(block)});
}

bool DelayLine::pop_ready(int64_t now_us, SampleBlock& out) {
  if (pending_.empty() || pending_.front().release_us > now_us) {
    return false;
  }
  return pop_any(out);
}

bool DelayLine::pop_any(SampleBlock& out) {
  if (pending_.empty()) {
    return false;
  }
  out = std::move(pending_.front().block);
  pending_.pop_front();
  return true;
}

int64_t DelayLine::time_to_next(int64_t now_us) const {
  if (pending_.empty()) {
    return -1;
  }
  const int64_t wait = pending_.front().release_us - now_us;
  return wait > 0 ? wait : 0;
}
