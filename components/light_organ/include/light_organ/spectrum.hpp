#pragma once
#include "esp_err.h"
#include "light_organ/types.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

struct FftBin {
  float re{0.0f};
  float im{0.0f};
};

// In-place iterative radix-2 FFT; data.size() must be a power of two.
void fft(std::vector<FftBin>& data);

class SpectralAnalyzer {
 public:
  SpectralAnalyzer(size_t fft_size, uint32_t sample_rate);

  // Magnitudes of bins 0..N/2 scaled by 1/N. ESP_ERR_INVALID_SIZE when the
  // frame length differs from the configured FFT size.
  esp_err_t analyze(const AnalysisFrame& frame, Spectrum& out);

  float bin_hz() const { return bin_hz_; }
  size_t bin_count() const { return fft_size_ / 2 + 1; }

 private:
  size_t fft_size_;
  float bin_hz_;
  std::vector<FftBin> scratch_;
};
