#include "ballot/detail/base_completion_queue.hpp"

#include <gtest/gtest.h>

#include <future>
#include <thread>

/**
 * @test Verify that we can run and shutdown a completion queue.
 */
TEST(base_completion_queue, run_shutdown) {
  ballot::detail::base_completion_queue queue;
  std::promise<void> start;
  std::promise<void> end;
  std::thread t([&]() {
    start.set_value();
    queue.run();
    end.set_value();
  });

  using namespace std::chrono_literals;
  auto start_fut = start.get_future();
  ASSERT_EQ(std::future_status::ready, start_fut.wait_for(500ms));
  EXPECT_EQ(queue.pending_count(), 0U);

  queue.shutdown();
  auto end_fut = end.get_future();
  ASSERT_EQ(std::future_status::ready, end_fut.wait_for(10 * ballot::detail::base_completion_queue::loop_timeout));

  t.join();
}
