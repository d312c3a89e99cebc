#include "light_organ/audio_pipeline.hpp"
#include "esp_log.h"
#include "light_organ/config.hpp"
#include "light_organ/errors.hpp"

static const char* TAG = "pipeline";

namespace {

int64_t frame_period_us(const OrganConfig& cfg) {
  return static_cast<int64_t>(block_size_for(cfg.capture)) * 1'000'000 / cfg.capture.sample_rate;
}

// Queued blocks plus the one in flight, on top of the configured delay.
int64_t backlog_limit_us(const OrganConfig& cfg) {
  const int64_t depth = cfg.pipeline.mode == PipelineMode::Threaded ? cfg.pipeline.queue_depth : 0;
  return (depth + 2) * frame_period_us(cfg) + static_cast<int64_t>(cfg.capture.delay_ms) * 1000;
}

}  // namespace

AudioPipeline::AudioPipeline(const OrganConfig& cfg)
    : windower_(cfg.analysis.fft_size),
      analyzer_(cfg.analysis.fft_size, cfg.capture.sample_rate),
      extractor_(cfg.analysis, cfg.analysis.fft_size, cfg.capture.sample_rate),
      mapper_(cfg.mapper, cfg.led_count),
      clock_(backlog_limit_us(cfg)) {
  diag_.block_size = block_size_for(cfg.capture);
  diag_.fft_size = cfg.analysis.fft_size;
  diag_.band_count = extractor_.band_count();
  diag_.led_count = cfg.led_count;
  diag_.bin_hz = analyzer_.bin_hz();

  ESP_LOGI(TAG, "Audio pipeline: sr=%u block=%u fft=%u bin=%.2f Hz bands=%u leds=%u strategy=%s",
           static_cast<unsigned>(cfg.capture.sample_rate), static_cast<unsigned>(diag_.block_size),
           static_cast<unsigned>(diag_.fft_size), diag_.bin_hz, static_cast<unsigned>(diag_.band_count),
           static_cast<unsigned>(diag_.led_count), mapper_.strategy().name());
}

esp_err_t AudioPipeline::process(const SampleBlock& block, int64_t now_us, PipelineOutput& out) {
  uint64_t missing = 0;
  const esp_err_t err = clock_.admit(block.seq, now_us, missing);
  if (err != ESP_OK && err != ORGAN_ERR_UNDERRUN) {
    return err;
  }
  if (err == ORGAN_ERR_UNDERRUN || block.dropped_before > 0) {
    windower_.reset();
    ++diag_.resets;
  }

  const AnalysisFrame frame = windower_.push(block);
  if (frame.primed) {
    const esp_err_t aerr = analyzer_.analyze(frame, spectrum_);
    if (aerr != ESP_OK) {
      ESP_LOGE(TAG, "Analysis of frame %llu failed: %s", static_cast<unsigned long long>(frame.seq),
               esp_err_to_name(aerr));
      return aerr;
    }
    out.bands = extractor_.extract(spectrum_);
    out.held = false;
  } else {
    out.bands = extractor_.hold();
    out.bands.seq = block.seq;
    out.held = true;
    ++diag_.held_frames;
  }
  out.pixels = mapper_.map(out.bands);
  ++diag_.frames;
  return ESP_OK;
}
