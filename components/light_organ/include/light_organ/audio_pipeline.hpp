#pragma once
#include "esp_err.h"
#include "light_organ/band_extractor.hpp"
#include "light_organ/color_mapper.hpp"
#include "light_organ/frame_windower.hpp"
#include "light_organ/pipeline_clock.hpp"
#include "light_organ/spectrum.hpp"
#include "light_organ/types.hpp"

struct PipelineOutput {
  PixelFrame pixels{};
  BandEnergy bands{};
  bool held{false};  // bands repeated from the last primed frame
};

struct PipelineDiagnostics {
  size_t block_size{0};
  size_t fft_size{0};
  size_t band_count{0};
  uint16_t led_count{0};
  float bin_hz{0.0f};
  uint64_t frames{0};
  uint64_t held_frames{0};
  uint64_t resets{0};
};

// Window -> analyze -> extract -> map for one SampleBlock at a time. Owns all
// analysis state; driven by a single task.
class AudioPipeline {
 public:
  // cfg must have passed config_validate().
  explicit AudioPipeline(const OrganConfig& cfg);

  // Produces the PixelFrame for block. A gap in the sequence resets the
  // windower; until it is primed again the last good bands are held.
  // ESP_ERR_INVALID_STATE for a duplicate or out-of-order block.
  esp_err_t process(const SampleBlock& block, int64_t now_us, PipelineOutput& out);

  PixelFrame idle_frame() const { return mapper_.blank(clock_.last_seq()); }

  PipelineClock& clock() { return clock_; }
  const PipelineClock& clock() const { return clock_; }
  const BandExtractor& extractor() const { return extractor_; }
  const ColorMapper& mapper() const { return mapper_; }
  PipelineDiagnostics diagnostics() const { return diag_; }

 private:
  FrameWindower windower_;
  SpectralAnalyzer analyzer_;
  BandExtractor extractor_;
  ColorMapper mapper_;
  PipelineClock clock_;
  Spectrum spectrum_{};
  PipelineDiagnostics diag_{};
};
