#include "light_organ/frame_windower.hpp"
#include <algorithm>
#include <cmath>

namespace {

void build_hann(std::vector<float>& w) {
  const size_t N = w.size();
  for (size_t i = 0; i < N; ++i) {
    w[i] = 0.5f * (1.0f - cosf(2.0f * static_cast<float>(M_PI) * i / (N - 1)));
  }
}

}  // namespace

FrameWindower::FrameWindower(size_t fft_size) : history_(fft_size, 0.0f), window_(fft_size, 1.0f) {
  if (fft_size > 1) {
    build_hann(window_);
  }
}

AnalysisFrame FrameWindower::push(const SampleBlock& block) {
  const size_t N = history_.size();
  const auto& in = block.samples;
  // Only the newest N samples of an oversized block can matter.
  const size_t take = std::min(in.size(), N);
  const size_t skip = in.size() - take;

  std::move(history_.begin() + take, history_.end(), history_.begin());
  for (size_t i = 0; i < take; ++i) {
    history_[N - take + i] = static_cast<float>(in[skip + i]) / 32768.0f;
  }
  valid_ = std::min(N, valid_ + take);

  AnalysisFrame frame{};
  frame.seq = block.seq;
  frame.primed = valid_ * 2 >= N;
  frame.samples.resize(N);
  for (size_t i = 0; i < N; ++i) {
    frame.samples[i] = history_[i] * window_[i];
  }
  return frame;
}

void FrameWindower::reset() {
  std::fill(history_.begin(), history_.end(), 0.0f);
  valid_ = 0;
}
