#pragma once
#include "esp_err.h"
#include <cstdint>

struct ClockStats {
  uint64_t frames{0};
  uint64_t underruns{0};       // blocks missing from the sequence
  uint64_t backlog_events{0};  // blocks that reached analysis later than allowed
  uint64_t rejected{0};        // duplicate or out-of-order sequence numbers
};

// Process-wide frame sequence tracker. Times are supplied by the caller so the
// clock stays usable without a running scheduler.
class PipelineClock {
 public:
  static constexpr int64_t kReportPeriodUs = 5'000'000;

  explicit PipelineClock(int64_t backlog_limit_us);

  // Admits seq as the next frame. `missing` receives the number of sequence
  // numbers skipped since the previous frame; the frame is still admitted but
  // the result is ORGAN_ERR_UNDERRUN. A duplicate or older seq returns
  // ESP_ERR_INVALID_STATE and must not be emitted.
  esp_err_t admit(uint64_t seq, int64_t now_us, uint64_t& missing);

  // True when the block captured at capture_us is older than the backlog limit.
  bool check_backlog(int64_t capture_us, int64_t now_us);

  void add_analysis_time(int64_t us) { window_analysis_us_ += us; }
  void add_transport_time(int64_t us) { window_transport_us_ += us; }

  // Logs the utilization report at debug level once per report period.
  // Returns true when a report was produced.
  bool maybe_report(int64_t now_us);

  const ClockStats& stats() const { return stats_; }
  uint64_t last_seq() const { return last_seq_; }

 private:
  int64_t backlog_limit_us_;
  bool started_{false};
  uint64_t last_seq_{0};
  ClockStats stats_{};

  int64_t window_start_us_{0};
  int64_t window_analysis_us_{0};
  int64_t window_transport_us_{0};
  uint64_t window_frames_{0};
  uint64_t window_underruns_{0};
};
