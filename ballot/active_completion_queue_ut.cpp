#include "ballot/active_completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>

/**
 * @test Verify that ballot::active_completion_queue can be created, moved, and destroyed.
 */
TEST(active_completion_queue, basic) {
  auto shq = std::make_shared<ballot::active_completion_queue>();
  EXPECT_NO_THROW(shq.reset());

  EXPECT_NO_THROW(ballot::active_completion_queue());

  {
    ballot::active_completion_queue orig;
    ballot::active_completion_queue copy(std::move(orig));
    EXPECT_FALSE(orig);
    EXPECT_TRUE(copy);
  }

  {
    ballot::active_completion_queue orig;
    EXPECT_TRUE(orig);
    ballot::active_completion_queue copy;
    EXPECT_TRUE(copy);

    copy = std::move(orig);
    EXPECT_FALSE(orig);
    EXPECT_TRUE(copy);
  }

  auto cq = std::make_shared<ballot::completion_queue<>>();
  std::thread t([cq]() { cq->run(); });
  EXPECT_TRUE(t.joinable());

  {
    ballot::active_completion_queue owner(std::move(cq), std::move(t));
    EXPECT_TRUE(owner);
    EXPECT_FALSE(t.joinable());
  }
}

/**
 * @test Verify that the thread in ballot::active_completion_queue runs the callbacks.
 */
TEST(active_completion_queue, runs_timers) {
  using namespace std::chrono_literals;
  ballot::active_completion_queue queue;

  std::promise<bool> fired;
  queue.cq().make_relative_timer(
      5ms, "test/timer", [&fired](ballot::detail::deadline_timer const&, bool ok) { fired.set_value(ok); });
  auto f = fired.get_future();
  ASSERT_EQ(std::future_status::ready, f.wait_for(2s));
  EXPECT_TRUE(f.get());
}
