#include <ballot/detail/exponential_backoff.hpp>

#include <gtest/gtest.h>

/**
 * @test Verify that invalid ranges are rejected.
 */
TEST(exponential_backoff, validation) {
  using namespace std::chrono_literals;
  EXPECT_THROW(ballot::detail::exponential_backoff(1s, 500ms), std::invalid_argument);
  EXPECT_THROW(ballot::detail::exponential_backoff(0ms, 500ms), std::invalid_argument);
  EXPECT_NO_THROW(ballot::detail::exponential_backoff(1s, 1500ms));
  EXPECT_NO_THROW(ballot::detail::exponential_backoff(1s, 1s));
}

/**
 * @test Verify that the delay doubles on each failure, saturates, and resets on success.
 */
TEST(exponential_backoff, basic) {
  using namespace std::chrono_literals;
  ballot::detail::exponential_backoff backoff(10ms, 50ms);
  EXPECT_EQ(backoff.current_delay().count(), 0);
  EXPECT_EQ(backoff.record_failure().count(), 10);
  EXPECT_EQ(backoff.record_failure().count(), 20);
  EXPECT_EQ(backoff.record_failure().count(), 40);
  EXPECT_EQ(backoff.record_failure().count(), 50);
  EXPECT_EQ(backoff.record_failure().count(), 50);
  EXPECT_EQ(backoff.current_delay().count(), 50);
  EXPECT_EQ(backoff.failure_count(), 5);

  EXPECT_EQ(backoff.record_success().count(), 0);
  EXPECT_EQ(backoff.failure_count(), 0);
  EXPECT_EQ(backoff.record_failure().count(), 10);

  // ... there is no limit on the number of attempts ...
  for (int i = 0; i != 100; ++i) {
    EXPECT_NO_THROW(backoff.record_failure());
  }
  EXPECT_EQ(backoff.current_delay().count(), 50);
}
