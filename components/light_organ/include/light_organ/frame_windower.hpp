#pragma once
#include "light_organ/types.hpp"
#include <cstddef>
#include <vector>

// Rolling buffer of the last fft_size samples. Every pushed block shifts the
// buffer and yields one Hann-windowed AnalysisFrame (hop = block size).
class FrameWindower {
 public:
  explicit FrameWindower(size_t fft_size);

  AnalysisFrame push(const SampleBlock& block);

  // Forget history; the buffer is zero-filled and frames are unprimed until
  // half of it holds new samples again.
  void reset();

  size_t fft_size() const { return history_.size(); }
  size_t valid_samples() const { return valid_; }

 private:
  std::vector<float> history_;
  std::vector<float> window_;
  size_t valid_{0};
};
