#include "light_organ/band_extractor.hpp"
#include "esp_log.h"
#include <algorithm>
#include <cmath>

static const char* TAG = "bands";

BandExtractor::BandExtractor(const AnalysisConfig& cfg, size_t fft_size, uint32_t sample_rate)
    : cfg_(cfg), refs_(cfg.bands, 0.0f), raw_(cfg.bands, 0.0f) {
  const size_t bands = cfg.bands;
  edges_.resize(bands + 1);
  const double ratio = static_cast<double>(cfg.high_hz) / cfg.low_hz;
  for (size_t i = 0; i <= bands; ++i) {
    edges_[i] = static_cast<float>(cfg.low_hz * std::pow(ratio, static_cast<double>(i) / bands));
  }
  edges_[bands] = cfg.high_hz;

  const float bin_hz = fft_size > 0 ? static_cast<float>(sample_rate) / fft_size : 0.0f;
  band_of_bin_.assign(fft_size / 2 + 1, -1);
  bins_per_band_.assign(bands, 0);
  for (size_t k = 0; k < band_of_bin_.size(); ++k) {
    const int band = band_for_frequency(k * bin_hz);
    band_of_bin_[k] = band;
    if (band >= 0) {
      ++bins_per_band_[band];
    }
  }

  last_.values.assign(bands, 0);
  for (size_t b = 0; b < bands; ++b) {
    if (bins_per_band_[b] == 0) {
      ESP_LOGW(TAG, "Band %u (%.0f-%.0f Hz) holds no FFT bin, it will stay dark",
               static_cast<unsigned>(b), edges_[b], edges_[b + 1]);
    }
  }
}

int BandExtractor::band_for_frequency(float hz) const {
  if (edges_.size() < 2 || !(hz >= edges_.front()) || !(hz < edges_.back())) {
    return -1;
  }
  const auto it = std::upper_bound(edges_.begin(), edges_.end(), hz);
  return static_cast<int>(it - edges_.begin()) - 1;
}

BandEnergy BandExtractor::extract(const Spectrum& spectrum) {
  const size_t bands = refs_.size();
  std::fill(raw_.begin(), raw_.end(), 0.0f);
  const size_t bins = std::min(spectrum.magnitudes.size(), band_of_bin_.size());
  for (size_t k = 0; k < bins; ++k) {
    const int band = band_of_bin_[k];
    if (band >= 0 && std::isfinite(spectrum.magnitudes[k])) {
      raw_[band] += spectrum.magnitudes[k];
    }
  }

  float loudest = 0.0f;
  for (size_t b = 0; b < bands; ++b) {
    raw_[b] = bins_per_band_[b] > 0 ? raw_[b] / bins_per_band_[b] : 0.0f;
    if (!std::isfinite(raw_[b]) || raw_[b] < 0.0f) {
      raw_[b] = 0.0f;
    }
    refs_[b] = std::max(refs_[b] * cfg_.decay, raw_[b]);
    loudest = std::max(loudest, refs_[b]);
  }

  BandEnergy out{};
  out.seq = spectrum.seq;
  out.values.assign(bands, 0);
  for (size_t b = 0; b < bands; ++b) {
    const float divisor = std::max({refs_[b], cfg_.coupling * loudest, cfg_.floor});
    if (raw_[b] <= 0.0f || !(divisor > 0.0f) || !std::isfinite(divisor)) {
      continue;
    }
    const long level = std::lround(255.0f * raw_[b] / divisor);
    out.values[b] = static_cast<uint8_t>(std::clamp(level, 0L, 255L));
  }
  last_ = out;
  return out;
}
