#include "light_organ/pipeline_clock.hpp"
#include "esp_log.h"
#include "light_organ/errors.hpp"

static const char* TAG = "clock";

PipelineClock::PipelineClock(int64_t backlog_limit_us) : backlog_limit_us_(backlog_limit_us) {}

esp_err_t PipelineClock::admit(uint64_t seq, int64_t now_us, uint64_t& missing) {
  missing = 0;
  if (!started_) {
    started_ = true;
    window_start_us_ = now_us;
  } else {
    if (seq <= last_seq_) {
      ++stats_.rejected;
      ESP_LOGW(TAG, "Rejecting frame %llu (last %llu)", static_cast<unsigned long long>(seq),
               static_cast<unsigned long long>(last_seq_));
      return ESP_ERR_INVALID_STATE;
    }
    missing = seq - last_seq_ - 1;
  }
  if (missing > 0) {
    stats_.underruns += missing;
    window_underruns_ += missing;
    ESP_LOGW(TAG, "Underrun: %llu block(s) missing before %llu", static_cast<unsigned long long>(missing),
             static_cast<unsigned long long>(seq));
  }
  last_seq_ = seq;
  ++stats_.frames;
  ++window_frames_;
  return missing > 0 ? ORGAN_ERR_UNDERRUN : ESP_OK;
}

bool PipelineClock::check_backlog(int64_t capture_us, int64_t now_us) {
  if (backlog_limit_us_ <= 0 || capture_us <= 0) {
    return false;
  }
  const int64_t age = now_us - capture_us;
  if (age <= backlog_limit_us_) {
    return false;
  }
  ++stats_.backlog_events;
  ESP_LOGD(TAG, "Backlog: block is %lld us old (limit %lld)", static_cast<long long>(age),
           static_cast<long long>(backlog_limit_us_));
  return true;
}

bool PipelineClock::maybe_report(int64_t now_us) {
  if (!started_) {
    return false;
  }
  const int64_t elapsed = now_us - window_start_us_;
  if (elapsed < kReportPeriodUs) {
    return false;
  }
  const double analysis = 100.0 * static_cast<double>(window_analysis_us_) / static_cast<double>(elapsed);
  const double transport = 100.0 * static_cast<double>(window_transport_us_) / static_cast<double>(elapsed);
  ESP_LOGD(TAG, "Utilization: analysis %.1f%% transport %.1f%% frames %llu underruns %llu", analysis, transport,
           static_cast<unsigned long long>(window_frames_), static_cast<unsigned long long>(window_underruns_));
  window_start_us_ = now_us;
  window_analysis_us_ = 0;
  window_transport_us_ = 0;
  window_frames_ = 0;
  window_underruns_ = 0;
  return true;
}
