#pragma once

#include "light_organ/audio_pipeline.hpp"
#include "light_organ/block_queue.hpp"
#include "light_organ/delay_line.hpp"
#include "light_organ/frame_sink.hpp"
#include "light_organ/types.hpp"
#include "pcm_capture.hpp"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/semphr.h"
#include "freertos/task.h"
#include <atomic>
#include <memory>

enum class RuntimeState {
  Starting,
  Running,
  Draining,
  Stopped,
};

// Process exit codes; non-zero names the stage that failed.
enum OrganExitCode : int {
  kOrganExitOk = 0,
  kOrganExitConfig = 1,
  kOrganExitCapture = 2,
  kOrganExitTransport = 3,
};

const char* runtime_state_to_string(RuntimeState state);

using SleepFn = void (*)(uint32_t ms);

// Blocks the calling task for ms (vTaskDelay).
void task_sleep_ms(uint32_t ms);

class OrganRuntime {
 public:
  ~OrganRuntime();

  // Builds the capture source, transport and pipeline. cfg must be validated.
  esp_err_t init(const OrganConfig& cfg);

  // Same, with the capture source, transport and time base supplied.
  esp_err_t init(const OrganConfig& cfg, std::unique_ptr<SampleSource> source, std::unique_ptr<FrameSink> sink,
                 CaptureClockFn now = esp_timer_get_time, SleepFn sleep = task_sleep_ms);

  // Runs until end of input, a stop request or a fatal error. Returns the
  // process exit code.
  int run();

  // Safe to call from a signal handler.
  void request_stop() { stop_.store(true); }

  RuntimeState state() const { return state_.load(); }

 private:
  static void capture_task_entry(void* arg);
  void capture_task_loop();

  int run_sync();
  int run_threaded();

  // Reopens the capture device with bounded exponential backoff. ESP_OK once
  // open, ORGAN_ERR_DEVICE when attempts ran out, ORGAN_ERR_END_OF_STREAM when
  // a stop was requested meanwhile.
  esp_err_t reopen_source();
  // Sleeps in short slices so a stop request cuts the wait short.
  void sleep_ms(uint32_t ms) const;
  // Capture outage: drops everything captured before it and asks the
  // analysis task to blank the strip.
  void on_capture_outage();

  // Sync-mode blocking read through the delay line.
  esp_err_t acquire(SampleBlock& out);

  esp_err_t process_and_emit(const SampleBlock& block);
  esp_err_t emit_idle();
  int finish(esp_err_t capture_err, esp_err_t transport_err);
  void set_state(RuntimeState next);

  OrganConfig cfg_{};
  CaptureClockFn now_{esp_timer_get_time};
  SleepFn sleep_{task_sleep_ms};
  std::unique_ptr<SampleSource> source_;
  std::unique_ptr<FrameSink> sink_;
  std::unique_ptr<AudioPipeline> pipeline_;
  std::unique_ptr<DelayLine> delay_;
  std::unique_ptr<BlockQueue> queue_;

  std::atomic<bool> stop_{false};
  std::atomic<RuntimeState> state_{RuntimeState::Starting};

  // Threaded mode: the capture task reports outages and its final result.
  SemaphoreHandle_t capture_done_{nullptr};
  std::atomic<bool> idle_requested_{false};
  std::atomic<esp_err_t> capture_result_{ESP_OK};
};
