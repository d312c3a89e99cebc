#pragma once
#include "light_organ/types.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

// Aggregates spectrum bins into log-spaced bands and normalizes them against a
// per-band decaying reference. Owns the normalization state; single writer.
class BandExtractor {
 public:
  BandExtractor(const AnalysisConfig& cfg, size_t fft_size, uint32_t sample_rate);

  BandEnergy extract(const Spectrum& spectrum);

  // Last BandEnergy produced by extract(), all zero before the first one.
  const BandEnergy& hold() const { return last_; }

  size_t band_count() const { return refs_.size(); }
  const std::vector<float>& edges() const { return edges_; }
  const std::vector<float>& references() const { return refs_; }

  // Band whose [edge[i], edge[i+1]) range contains hz, or -1.
  int band_for_frequency(float hz) const;

 private:
  AnalysisConfig cfg_;
  std::vector<float> edges_;
  std::vector<int> band_of_bin_;
  std::vector<uint16_t> bins_per_band_;
  std::vector<float> refs_;
  std::vector<float> raw_;
  BandEnergy last_{};
};
