#include "ballot/completion_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace ballot {
namespace detail {
struct base_completion_queue_test_only {
  static grpc::CompletionQueue* get_raw_queue(base_completion_queue& q) {
    return q.cq();
  }
};
} // namespace detail
} // namespace ballot

/**
 * @test Verify that timers fire, and cancelled timers report ok == false.
 */
TEST(completion_queue, timers) {
  ballot::completion_queue<> queue;

  std::atomic<int> cnt(0);
  std::atomic<int> cxl(0);
  auto functor = [&cnt, &cxl](ballot::detail::deadline_timer const&, bool ok) {
    if (not ok) {
      ++cxl;
    } else {
      ++cnt;
    }
  };

  using namespace std::chrono_literals;

  auto canceled = queue.make_relative_timer(5ms, "test/canceled", functor);
  canceled->cancel();
  auto timer = queue.make_relative_timer(5ms, "test/timer", functor);
  std::thread t([&queue]() { queue.run(); });

  for (int i = 0; i != 100 and (cnt.load() == 0 or cxl.load() == 0); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(cnt.load(), 1);
  EXPECT_EQ(cxl.load(), 1);
  EXPECT_EQ(queue.pending_count(), 0U);

  queue.shutdown();
  t.join();
}

/**
 * @test Make sure ballot::completion_queue ignores tags it does not know about.
 */
TEST(completion_queue, unknown_tags) {
  using namespace std::chrono_literals;

  ballot::completion_queue<> queue;
  std::thread t([&queue]() { queue.run(); });

  grpc::CompletionQueue* cq = ballot::detail::base_completion_queue_test_only::get_raw_queue(queue);

  std::atomic<int> cnt(0);
  auto op = queue.make_relative_timer(
      30ms, "test/alarm-after", [&cnt](ballot::detail::deadline_timer const&, bool) { ++cnt; });
  // ... an earlier alarm with a null tag, and another with a tag the queue does not know about ...
  grpc::Alarm al1(cq, std::chrono::system_clock::now() + 10ms, nullptr);
  grpc::Alarm al2(cq, std::chrono::system_clock::now() + 20ms, static_cast<void*>(&cnt));

  for (int i = 0; i != 100 and cnt.load() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  EXPECT_EQ(cnt.load(), 1);

  queue.shutdown();
  t.join();
}
