#include "light_organ/block_queue.hpp"
#include "esp_log.h"
#include "light_organ/errors.hpp"
#include <chrono>
#include <utility>

static const char* TAG = "block-queue";

BlockQueue::BlockQueue(size_t depth) : depth_(depth == 0 ? 1 : depth) {}

bool BlockQueue::push(SampleBlock&& block) {
  bool dropped = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return false;
    }
    if (blocks_.size() >= depth_) {
      ESP_LOGD(TAG, "Queue full, dropping block %llu", static_cast<unsigned long long>(blocks_.front().seq));
      blocks_.pop_front();
      ++dropped_;
      dropped = true;
    }
    blocks_.push_back(std::move(block));
  }
  ready_.notify_one();
  return dropped;
}

esp_err_t BlockQueue::pop(SampleBlock& out, uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  ready_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return !blocks_.empty() || closed_; });
  if (!blocks_.empty()) {
    out = std::move(blocks_.front());
    blocks_.pop_front();
    lock.unlock();
    space_.notify_one();
    return ESP_OK;
  }
  if (closed_) {
    return ORGAN_ERR_END_OF_STREAM;
  }
  return ESP_ERR_TIMEOUT;
}

bool BlockQueue::wait_for_space(uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(mutex_);
  space_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                  [this] { return blocks_.size() < depth_ || closed_; });
  return !closed_ && blocks_.size() < depth_;
}

size_t BlockQueue::clear() {
  size_t cleared = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cleared = blocks_.size();
    blocks_.clear();
  }
  space_.notify_all();
  return cleared;
}

void BlockQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  ready_.notify_all();
  space_.notify_all();
}

bool BlockQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

size_t BlockQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}

uint64_t BlockQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}
