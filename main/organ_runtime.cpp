#include "organ_runtime.hpp"
#include "esp_log.h"
#include "esp_timer.h"
#include "light_organ/backoff.hpp"
#include "light_organ/config.hpp"
#include "light_organ/errors.hpp"
#include <algorithm>
#include <utility>

static const char* TAG = "runtime";

namespace {

constexpr uint32_t kPollMs = 100;
constexpr uint32_t kSleepSliceMs = 50;

uint32_t wait_budget_ms(const DelayLine& delay, int64_t now_us) {
  const int64_t next = delay.time_to_next(now_us);
  if (next < 0) {
    return kPollMs;
  }
  const int64_t ms = (next + 999) / 1000;
  return static_cast<uint32_t>(std::min<int64_t>(ms, kPollMs));
}

}  // namespace

const char* runtime_state_to_string(RuntimeState state) {
  switch (state) {
    case RuntimeState::Starting:
      return "starting";
    case RuntimeState::Running:
      return "running";
    case RuntimeState::Draining:
      return "draining";
    case RuntimeState::Stopped:
      return "stopped";
  }
  return "unknown";
}

void task_sleep_ms(uint32_t ms) {
  vTaskDelay(pdMS_TO_TICKS(ms));
}

OrganRuntime::~OrganRuntime() = default;

esp_err_t OrganRuntime::init(const OrganConfig& cfg) {
  std::unique_ptr<SampleSource> source;
  esp_err_t err = pcm_capture_create(cfg.capture, esp_timer_get_time, source);
  if (err != ESP_OK) {
    return err;
  }
  std::unique_ptr<FrameSink> sink;
  err = frame_sink_open(cfg, sink);
  if (err != ESP_OK) {
    return err;
  }
  return init(cfg, std::move(source), std::move(sink));
}

esp_err_t OrganRuntime::init(const OrganConfig& cfg, std::unique_ptr<SampleSource> source,
                             std::unique_ptr<FrameSink> sink, CaptureClockFn now, SleepFn sleep) {
  if (!source || !sink || !now || !sleep) {
    return ESP_ERR_INVALID_ARG;
  }
  cfg_ = cfg;
  now_ = now;
  sleep_ = sleep;
  source_ = std::move(source);
  sink_ = std::move(sink);
  pipeline_ = std::make_unique<AudioPipeline>(cfg_);
  delay_ = std::make_unique<DelayLine>(cfg_.capture.delay_ms);
  if (cfg_.pipeline.mode == PipelineMode::Threaded) {
    queue_ = std::make_unique<BlockQueue>(cfg_.pipeline.queue_depth);
  }
  ESP_LOGI(TAG, "Runtime ready: mode=%s device=%s delay=%u ms", pipeline_mode_to_string(cfg_.pipeline.mode),
           source_->describe().c_str(), static_cast<unsigned>(cfg_.capture.delay_ms));
  return ESP_OK;
}

void OrganRuntime::set_state(RuntimeState next) {
  const RuntimeState prev = state_.exchange(next);
  if (prev != next) {
    ESP_LOGD(TAG, "State %s -> %s", runtime_state_to_string(prev), runtime_state_to_string(next));
  }
}

int OrganRuntime::run() {
  if (!source_ || !sink_ || !pipeline_) {
    ESP_LOGE(TAG, "Runtime not initialized");
    return kOrganExitConfig;
  }
  set_state(RuntimeState::Running);
  return cfg_.pipeline.mode == PipelineMode::Sync ? run_sync() : run_threaded();
}

void OrganRuntime::sleep_ms(uint32_t ms) const {
  while (ms > 0 && !stop_.load()) {
    const uint32_t slice = std::min(ms, kSleepSliceMs);
    sleep_(slice);
    ms -= slice;
  }
}

void OrganRuntime::on_capture_outage() {
  delay_->clear();
  const size_t stale = queue_->clear();
  if (stale > 0) {
    ESP_LOGD(TAG, "Discarded %u block(s) captured before the outage", static_cast<unsigned>(stale));
  }
  idle_requested_.store(true);
}

esp_err_t OrganRuntime::reopen_source() {
  Backoff backoff(cfg_.capture.max_retries);
  uint32_t delay_ms = 0;
  while (!stop_.load()) {
    if (!backoff.next(delay_ms)) {
      ESP_LOGE(TAG, "Capture device %s unavailable after %u attempts", source_->describe().c_str(),
               static_cast<unsigned>(backoff.attempts()));
      return ORGAN_ERR_DEVICE;
    }
    ESP_LOGW(TAG, "Reopening %s in %u ms (attempt %u/%u)", source_->describe().c_str(),
             static_cast<unsigned>(delay_ms), static_cast<unsigned>(backoff.attempts()),
             static_cast<unsigned>(cfg_.capture.max_retries));
    sleep_ms(delay_ms);
    if (stop_.load()) {
      break;
    }
    if (source_->open() == ESP_OK) {
      ESP_LOGI(TAG, "Capture device %s is back", source_->describe().c_str());
      return ESP_OK;
    }
  }
  return ORGAN_ERR_END_OF_STREAM;
}

esp_err_t OrganRuntime::emit_idle() {
  const esp_err_t err = sink_->emit_idle();
  if (err != ESP_OK) {
    ESP_LOGE(TAG, "Idle frame not delivered: %s", organ_err_to_name(err));
  }
  return err;
}

esp_err_t OrganRuntime::process_and_emit(const SampleBlock& block) {
  PipelineClock& clock = pipeline_->clock();
  const int64_t start_us = now_();
  clock.check_backlog(block.timestamp_us, start_us);

  PipelineOutput out;
  const esp_err_t err = pipeline_->process(block, start_us, out);
  if (err != ESP_OK) {
    ESP_LOGW(TAG, "Block %llu skipped: %s", static_cast<unsigned long long>(block.seq), organ_err_to_name(err));
    return ESP_OK;
  }
  const int64_t analyzed_us = now_();
  clock.add_analysis_time(analyzed_us - start_us);

  const esp_err_t terr = sink_->emit(out.pixels, out.bands);
  const int64_t done_us = now_();
  clock.add_transport_time(done_us - analyzed_us);
  clock.maybe_report(done_us);
  return terr;
}

esp_err_t OrganRuntime::acquire(SampleBlock& out) {
  if (delay_->pop_ready(now_(), out)) {
    return ESP_OK;
  }
  if (!source_->is_open()) {
    // Input ended: play out whatever the delay line still holds.
    if (delay_->empty()) {
      return ORGAN_ERR_END_OF_STREAM;
    }
    sleep_ms(wait_budget_ms(*delay_, now_()));
    return delay_->pop_ready(now_(), out) ? ESP_OK : ESP_ERR_TIMEOUT;
  }

  SampleBlock block;
  const esp_err_t err = source_->next_block(block, wait_budget_ms(*delay_, now_()));
  if (err == ORGAN_ERR_END_OF_STREAM) {
    return delay_->empty() ? err : ESP_ERR_TIMEOUT;
  }
  if (err == ORGAN_ERR_DEVICE) {
    delay_->clear();
    return err;
  }
  if (err == ESP_OK) {
    delay_->push(std::move(block), now_());
  }
  return delay_->pop_ready(now_(), out) ? ESP_OK : ESP_ERR_TIMEOUT;
}

int OrganRuntime::run_sync() {
  esp_err_t capture_err = ESP_OK;
  esp_err_t transport_err = ESP_OK;

  if (source_->open() != ESP_OK) {
    transport_err = emit_idle();
    if (transport_err == ESP_OK && reopen_source() == ORGAN_ERR_DEVICE) {
      capture_err = ORGAN_ERR_DEVICE;
    }
  }

  while (capture_err == ESP_OK && transport_err == ESP_OK && !stop_.load()) {
    SampleBlock block;
    const esp_err_t err = acquire(block);
    if (err == ESP_ERR_TIMEOUT) {
      continue;
    }
    if (err == ORGAN_ERR_END_OF_STREAM) {
      break;
    }
    if (err == ORGAN_ERR_DEVICE) {
      transport_err = emit_idle();
      if (transport_err == ESP_OK && reopen_source() == ORGAN_ERR_DEVICE) {
        capture_err = ORGAN_ERR_DEVICE;
      }
      continue;
    }
    transport_err = process_and_emit(block);
  }
  return finish(capture_err, transport_err);
}

void OrganRuntime::capture_task_entry(void* arg) {
  auto* self = reinterpret_cast<OrganRuntime*>(arg);
  if (self) {
    self->capture_task_loop();
  }
  vTaskDelete(nullptr);
}

void OrganRuntime::capture_task_loop() {
  esp_err_t result = ESP_OK;

  auto forward = [this](SampleBlock&& block) {
    if (!source_->is_live()) {
      // Finite input can be read at will; wait instead of dropping.
      while (!queue_->wait_for_space(kPollMs)) {
        if (stop_.load() || queue_->closed()) {
          return;
        }
      }
    }
    const uint64_t seq = block.seq;
    if (queue_->push(std::move(block))) {
      ESP_LOGD(TAG, "Analysis behind, oldest queued block dropped before %llu", static_cast<unsigned long long>(seq));
    }
  };

  if (source_->open() != ESP_OK) {
    idle_requested_.store(true);
    if (reopen_source() == ORGAN_ERR_DEVICE) {
      result = ORGAN_ERR_DEVICE;
    }
  }

  while (result == ESP_OK && !stop_.load() && !queue_->closed()) {
    SampleBlock ready;
    while (delay_->pop_ready(now_(), ready)) {
      forward(std::move(ready));
    }

    SampleBlock block;
    const esp_err_t err = source_->next_block(block, wait_budget_ms(*delay_, now_()));
    if (err == ESP_OK) {
      delay_->push(std::move(block), now_());
      continue;
    }
    if (err == ESP_ERR_TIMEOUT) {
      continue;
    }
    if (err == ORGAN_ERR_END_OF_STREAM) {
      while (!delay_->empty() && !stop_.load()) {
        sleep_ms(wait_budget_ms(*delay_, now_()));
        if (delay_->pop_ready(now_(), ready)) {
          forward(std::move(ready));
        }
      }
      break;
    }
    on_capture_outage();
    if (reopen_source() == ORGAN_ERR_DEVICE) {
      result = ORGAN_ERR_DEVICE;
    }
  }

  capture_result_.store(result);
  queue_->close();
  xSemaphoreGive(capture_done_);
}

int OrganRuntime::run_threaded() {
  capture_done_ = xSemaphoreCreateBinary();
  if (!capture_done_) {
    ESP_LOGE(TAG, "capture: cannot allocate task semaphore");
    return finish(ESP_ERR_NO_MEM, ESP_OK);
  }
  const BaseType_t res = xTaskCreate(capture_task_entry, "capture", 8192, this, 5, nullptr);
  if (res != pdPASS) {
    vSemaphoreDelete(capture_done_);
    capture_done_ = nullptr;
    ESP_LOGE(TAG, "capture: failed to start capture task");
    return finish(ESP_FAIL, ESP_OK);
  }

  esp_err_t transport_err = ESP_OK;
  while (transport_err == ESP_OK) {
    if (idle_requested_.exchange(false)) {
      transport_err = emit_idle();
      continue;
    }
    SampleBlock block;
    const esp_err_t err = queue_->pop(block, kPollMs);
    if (err == ESP_ERR_TIMEOUT) {
      continue;
    }
    if (err == ORGAN_ERR_END_OF_STREAM) {
      break;
    }
    transport_err = process_and_emit(block);
  }

  if (transport_err != ESP_OK) {
    stop_.store(true);
  }
  set_state(RuntimeState::Draining);
  queue_->close();
  xSemaphoreTake(capture_done_, portMAX_DELAY);
  vSemaphoreDelete(capture_done_);
  capture_done_ = nullptr;
  return finish(capture_result_.load(), transport_err);
}

int OrganRuntime::finish(esp_err_t capture_err, esp_err_t transport_err) {
  if (transport_err == ESP_OK) {
    set_state(RuntimeState::Draining);
    if (sink_->emit_idle() != ESP_OK) {
      ESP_LOGW(TAG, "Final idle frame not delivered");
    }
  }
  sink_->close();
  source_->close();
  set_state(RuntimeState::Stopped);

  const ClockStats& stats = pipeline_->clock().stats();
  const PipelineDiagnostics diag = pipeline_->diagnostics();
  ESP_LOGI(TAG, "Stopped: frames=%llu held=%llu underruns=%llu backlog=%llu queue_drops=%llu",
           static_cast<unsigned long long>(stats.frames), static_cast<unsigned long long>(diag.held_frames),
           static_cast<unsigned long long>(stats.underruns), static_cast<unsigned long long>(stats.backlog_events),
           static_cast<unsigned long long>(queue_ ? queue_->dropped() : 0));

  if (transport_err != ESP_OK) {
    ESP_LOGE(TAG, "transport: %s", organ_err_to_name(transport_err));
    return kOrganExitTransport;
  }
  if (capture_err != ESP_OK) {
    ESP_LOGE(TAG, "capture: %s", organ_err_to_name(capture_err));
    return kOrganExitCapture;
  }
  return kOrganExitOk;
}
