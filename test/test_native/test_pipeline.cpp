/**
 * Pipeline end to end: synthetic capture through to PixelFrames.
 */

#include <unity.h>
#include "light_organ/audio_pipeline.hpp"
#include "light_organ/config.hpp"
#include "light_organ/errors.hpp"
#include "test_signals.hpp"
#include <vector>

static const size_t kBlock = 735;
static const int64_t kPeriodUs = 16666;

static OrganConfig six_led_config() {
  OrganConfig cfg{};
  config_reset_defaults(cfg);
  cfg.led_count = 6;
  return cfg;
}

static uint8_t brightest_channel(const Rgb8& px) {
  uint8_t m = px.r;
  if (px.g > m) m = px.g;
  if (px.b > m) m = px.b;
  return m;
}

static void test_two_kilohertz_lights_band_six(void) {
  const OrganConfig cfg = six_led_config();
  TEST_ASSERT_EQUAL(ESP_OK, config_validate(cfg));
  AudioPipeline pipeline(cfg);
  const PipelineDiagnostics diag = pipeline.diagnostics();
  TEST_ASSERT_EQUAL_UINT32(kBlock, diag.block_size);
  TEST_ASSERT_EQUAL_UINT32(9, diag.band_count);
  TEST_ASSERT_EQUAL(6, pipeline.extractor().band_for_frequency(2000.0f));

  ToneGenerator tone(2000.0f, 44100);
  size_t primed = 0;
  for (int i = 0; i < 60; ++i) {
    const SampleBlock block = tone.next(kBlock);
    PipelineOutput out{};
    TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(block, block.seq * kPeriodUs, out));
    TEST_ASSERT_EQUAL_UINT64(block.seq, out.pixels.seq);
    TEST_ASSERT_EQUAL_UINT32(6, out.pixels.pixels.size());
    TEST_ASSERT_EQUAL_UINT32(9, out.bands.values.size());
    if (i == 0) {
      TEST_ASSERT_TRUE(out.held);
      continue;
    }
    TEST_ASSERT_FALSE(out.held);
    ++primed;
    TEST_ASSERT_EQUAL_UINT32(6, index_of_max(out.bands.values));

    // LED 4 carries band 6 alone; rainbow hue 240 on six LEDs.
    const Rgb8& led4 = out.pixels.pixels[4];
    TEST_ASSERT_EQUAL_UINT8(0, led4.r);
    TEST_ASSERT_EQUAL_UINT8(0, led4.g);
    TEST_ASSERT_TRUE(led4.b > 0);
    for (size_t led = 0; led < out.pixels.pixels.size(); ++led) {
      if (led != 4) {
        TEST_ASSERT_TRUE(brightest_channel(out.pixels.pixels[led]) < led4.b);
      }
    }
  }
  TEST_ASSERT_EQUAL_UINT32(59, primed);
  TEST_ASSERT_EQUAL_UINT64(60, pipeline.clock().stats().frames);
  TEST_ASSERT_EQUAL_UINT64(0, pipeline.clock().stats().underruns);
}

static void test_same_input_same_output(void) {
  const OrganConfig cfg = six_led_config();
  AudioPipeline a(cfg);
  AudioPipeline b(cfg);
  ToneGenerator tone_a(700.0f, 44100, 0.3f);
  ToneGenerator tone_b(700.0f, 44100, 0.3f);
  for (int i = 0; i < 20; ++i) {
    const SampleBlock block_a = tone_a.next(kBlock);
    const SampleBlock block_b = tone_b.next(kBlock);
    PipelineOutput out_a{};
    PipelineOutput out_b{};
    TEST_ASSERT_EQUAL(ESP_OK, a.process(block_a, i * kPeriodUs, out_a));
    TEST_ASSERT_EQUAL(ESP_OK, b.process(block_b, i * kPeriodUs, out_b));
    TEST_ASSERT_EQUAL_UINT8_ARRAY(out_a.bands.values.data(), out_b.bands.values.data(), 9);
    for (size_t led = 0; led < 6; ++led) {
      TEST_ASSERT_EQUAL_UINT8(out_a.pixels.pixels[led].r, out_b.pixels.pixels[led].r);
      TEST_ASSERT_EQUAL_UINT8(out_a.pixels.pixels[led].g, out_b.pixels.pixels[led].g);
      TEST_ASSERT_EQUAL_UINT8(out_a.pixels.pixels[led].b, out_b.pixels.pixels[led].b);
    }
  }
}

static void test_silence_stays_dark(void) {
  AudioPipeline pipeline(six_led_config());
  for (uint64_t seq = 0; seq < 10; ++seq) {
    PipelineOutput out{};
    TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(silent_block(seq, kBlock), seq * kPeriodUs, out));
    for (const Rgb8& px : out.pixels.pixels) {
      TEST_ASSERT_EQUAL_UINT8(0, brightest_channel(px));
    }
  }
}

static void test_silence_after_loud_passage_goes_dark(void) {
  AudioPipeline pipeline(six_led_config());
  ToneGenerator tone(1000.0f, 44100, 0.9f);
  PipelineOutput out{};
  uint64_t seq = 0;
  for (; seq < 30; ++seq) {
    const SampleBlock block = tone.next(kBlock);
    TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(block, block.seq * kPeriodUs, out));
  }
  uint8_t lit = 0;
  for (const Rgb8& px : out.pixels.pixels) {
    if (brightest_channel(px) > lit) lit = brightest_channel(px);
  }
  TEST_ASSERT_TRUE(lit > 0);

  // Three silent blocks push every tone sample out of the 2048-sample window.
  for (int i = 0; i < 20; ++i, ++seq) {
    TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(silent_block(seq, kBlock), seq * kPeriodUs, out));
    if (i < 3) {
      continue;
    }
    TEST_ASSERT_FALSE(out.held);
    for (uint8_t v : out.bands.values) {
      TEST_ASSERT_EQUAL_UINT8(0, v);
    }
    for (const Rgb8& px : out.pixels.pixels) {
      TEST_ASSERT_EQUAL_UINT8(0, brightest_channel(px));
    }
  }
}

static void test_gap_holds_last_bands_and_counts_underruns(void) {
  AudioPipeline pipeline(six_led_config());
  ToneGenerator tone(2000.0f, 44100);
  PipelineOutput out{};
  for (int i = 0; i < 10; ++i) {
    const SampleBlock block = tone.next(kBlock);
    TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(block, block.seq * kPeriodUs, out));
  }
  const std::vector<uint8_t> last_good = out.bands.values;

  tone.skip(3, kBlock);
  const SampleBlock after_gap = tone.next(kBlock);
  TEST_ASSERT_EQUAL_UINT64(13, after_gap.seq);
  TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(after_gap, after_gap.seq * kPeriodUs, out));
  TEST_ASSERT_TRUE(out.held);
  TEST_ASSERT_EQUAL_UINT64(13, out.bands.seq);
  TEST_ASSERT_EQUAL_UINT8_ARRAY(last_good.data(), out.bands.values.data(), last_good.size());
  TEST_ASSERT_EQUAL_UINT64(3, pipeline.clock().stats().underruns);
  TEST_ASSERT_EQUAL_UINT64(1, pipeline.diagnostics().resets);

  const SampleBlock resumed = tone.next(kBlock);
  TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(resumed, resumed.seq * kPeriodUs, out));
  TEST_ASSERT_FALSE(out.held);
  TEST_ASSERT_EQUAL_UINT32(6, index_of_max(out.bands.values));
}

static void test_source_reported_loss_resets_window(void) {
  AudioPipeline pipeline(six_led_config());
  ToneGenerator tone(2000.0f, 44100);
  PipelineOutput out{};
  for (int i = 0; i < 3; ++i) {
    const SampleBlock block = tone.next(kBlock);
    TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(block, block.seq * kPeriodUs, out));
  }
  SampleBlock block = tone.next(kBlock);
  block.dropped_before = 1;
  TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(block, block.seq * kPeriodUs, out));
  TEST_ASSERT_TRUE(out.held);
  TEST_ASSERT_EQUAL_UINT64(1, pipeline.diagnostics().resets);
  TEST_ASSERT_EQUAL_UINT64(0, pipeline.clock().stats().underruns);
}

static void test_duplicate_block_is_rejected(void) {
  AudioPipeline pipeline(six_led_config());
  PipelineOutput out{};
  TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(silent_block(4, kBlock), 0, out));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, pipeline.process(silent_block(4, kBlock), kPeriodUs, out));
  TEST_ASSERT_EQUAL(ESP_ERR_INVALID_STATE, pipeline.process(silent_block(2, kBlock), kPeriodUs, out));
  TEST_ASSERT_EQUAL_UINT64(2, pipeline.clock().stats().rejected);
  TEST_ASSERT_EQUAL_UINT64(1, pipeline.clock().stats().frames);
  TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(silent_block(5, kBlock), 2 * kPeriodUs, out));
}

static void test_idle_frame_matches_led_count(void) {
  AudioPipeline pipeline(six_led_config());
  PipelineOutput out{};
  TEST_ASSERT_EQUAL(ESP_OK, pipeline.process(silent_block(0, kBlock), 0, out));
  const PixelFrame idle = pipeline.idle_frame();
  TEST_ASSERT_EQUAL_UINT32(6, idle.pixels.size());
  for (const Rgb8& px : idle.pixels) {
    TEST_ASSERT_EQUAL_UINT8(0, brightest_channel(px));
  }
}

static void test_clock_backlog_and_report(void) {
  PipelineClock clock(4 * 16666);
  uint64_t missing = 0;
  TEST_ASSERT_EQUAL(ESP_OK, clock.admit(0, 0, missing));
  TEST_ASSERT_EQUAL(ORGAN_ERR_UNDERRUN, clock.admit(3, 0, missing));
  TEST_ASSERT_EQUAL_UINT64(2, missing);
  TEST_ASSERT_EQUAL_UINT64(3, clock.last_seq());
  TEST_ASSERT_EQUAL(ESP_OK, clock.admit(4, 0, missing));
  TEST_ASSERT_EQUAL_UINT64(0, missing);
  TEST_ASSERT_FALSE(clock.check_backlog(0, 100000));
  TEST_ASSERT_FALSE(clock.check_backlog(100000, 150000));
  TEST_ASSERT_TRUE(clock.check_backlog(100000, 200000));
  TEST_ASSERT_EQUAL_UINT64(1, clock.stats().backlog_events);

  clock.add_analysis_time(1000);
  TEST_ASSERT_FALSE(clock.maybe_report(PipelineClock::kReportPeriodUs - 1));
  TEST_ASSERT_TRUE(clock.maybe_report(PipelineClock::kReportPeriodUs));
  TEST_ASSERT_FALSE(clock.maybe_report(PipelineClock::kReportPeriodUs + 1));
}

void run_pipeline_tests() {
  RUN_TEST(test_two_kilohertz_lights_band_six);
  RUN_TEST(test_same_input_same_output);
  RUN_TEST(test_silence_stays_dark);
  RUN_TEST(test_silence_after_loud_passage_goes_dark);
  RUN_TEST(test_gap_holds_last_bands_and_counts_underruns);
  RUN_TEST(test_source_reported_loss_resets_window);
  RUN_TEST(test_duplicate_block_is_rejected);
  RUN_TEST(test_idle_frame_matches_led_count);
  RUN_TEST(test_clock_backlog_and_report);
}
