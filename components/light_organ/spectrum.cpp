#include "light_organ/spectrum.hpp"
#include "esp_log.h"
#include <cmath>
#include <utility>

static const char* TAG = "spectrum";

void fft(std::vector<FftBin>& data) {
  const size_t n = data.size();
  for (size_t i = 1, j = 0; i < n; ++i) {
    size_t bit = n >> 1;
    for (; j & bit; bit >>= 1) {
      j ^= bit;
    }
    j ^= bit;
    if (i < j) {
      std::swap(data[i], data[j]);
    }
  }
  for (size_t len = 2; len <= n; len <<= 1) {
    const size_t half = len / 2;
    for (size_t j = 0; j < half; ++j) {
      // One twiddle per butterfly column.
      const float ang = -2.0f * static_cast<float>(M_PI) * j / len;
      const FftBin w{cosf(ang), sinf(ang)};
      for (size_t i = 0; i < n; i += len) {
        FftBin& a = data[i + j];
        FftBin& b = data[i + j + half];
        const FftBin v{b.re * w.re - b.im * w.im, b.re * w.im + b.im * w.re};
        b.re = a.re - v.re;
        b.im = a.im - v.im;
        a.re += v.re;
        a.im += v.im;
      }
    }
  }
}

SpectralAnalyzer::SpectralAnalyzer(size_t fft_size, uint32_t sample_rate)
    : fft_size_(fft_size),
      bin_hz_(fft_size > 0 ? static_cast<float>(sample_rate) / fft_size : 0.0f),
      scratch_(fft_size) {}

esp_err_t SpectralAnalyzer::analyze(const AnalysisFrame& frame, Spectrum& out) {
  if (frame.samples.size() != fft_size_ || fft_size_ == 0) {
    ESP_LOGE(TAG, "Frame %llu has %u samples, expected %u",
             static_cast<unsigned long long>(frame.seq),
             static_cast<unsigned>(frame.samples.size()),
             static_cast<unsigned>(fft_size_));
    return ESP_ERR_INVALID_SIZE;
  }
  for (size_t i = 0; i < fft_size_; ++i) {
    scratch_[i].re = frame.samples[i];
    scratch_[i].im = 0.0f;
  }
  fft(scratch_);

  const float norm = 1.0f / static_cast<float>(fft_size_);
  out.seq = frame.seq;
  out.bin_hz = bin_hz_;
  out.magnitudes.resize(bin_count());
  for (size_t k = 0; k < out.magnitudes.size(); ++k) {
    const float m = sqrtf(scratch_[k].re * scratch_[k].re + scratch_[k].im * scratch_[k].im) * norm;
    out.magnitudes[k] = std::isfinite(m) ? m : 0.0f;
  }
  return ESP_OK;
}
