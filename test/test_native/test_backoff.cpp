/**
 * Reopen backoff schedule.
 */

#include <unity.h>
#include "light_organ/backoff.hpp"

static void test_doubles_up_to_cap(void) {
  Backoff backoff(10);
  const uint32_t expected[] = {100, 200, 400, 800, 1600, 3200, 5000, 5000, 5000, 5000};
  for (uint32_t want : expected) {
    uint32_t delay = 0;
    TEST_ASSERT_TRUE(backoff.next(delay));
    TEST_ASSERT_EQUAL_UINT32(want, delay);
  }
  TEST_ASSERT_TRUE(backoff.exhausted());
  uint32_t delay = 0;
  TEST_ASSERT_FALSE(backoff.next(delay));
}

static void test_reset_restarts_schedule(void) {
  Backoff backoff(3);
  uint32_t delay = 0;
  backoff.next(delay);
  backoff.next(delay);
  TEST_ASSERT_EQUAL_UINT32(2, backoff.attempts());
  backoff.reset();
  TEST_ASSERT_EQUAL_UINT32(0, backoff.attempts());
  TEST_ASSERT_TRUE(backoff.next(delay));
  TEST_ASSERT_EQUAL_UINT32(100, delay);
}

static void test_zero_attempts_never_retries(void) {
  Backoff backoff(0);
  uint32_t delay = 7;
  TEST_ASSERT_TRUE(backoff.exhausted());
  TEST_ASSERT_FALSE(backoff.next(delay));
  TEST_ASSERT_EQUAL_UINT32(7, delay);
}

static void test_custom_base_and_cap(void) {
  Backoff backoff(4, 10, 25);
  uint32_t delay = 0;
  backoff.next(delay);
  TEST_ASSERT_EQUAL_UINT32(10, delay);
  backoff.next(delay);
  TEST_ASSERT_EQUAL_UINT32(20, delay);
  backoff.next(delay);
  TEST_ASSERT_EQUAL_UINT32(25, delay);
}

void run_backoff_tests() {
  RUN_TEST(test_doubles_up_to_cap);
  RUN_TEST(test_reset_restarts_schedule);
  RUN_TEST(test_zero_attempts_never_retries);
  RUN_TEST(test_custom_base_and_cap);
}
