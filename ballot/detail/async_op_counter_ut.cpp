#include "ballot/detail/async_op_counter.hpp"

#include <gtest/gtest.h>
#include <thread>

/**
 * @test Verify that ballot::detail::async_op_counter tracks operations and blocks until they complete.
 */
TEST(async_op_counter, basic) {
  ballot::detail::async_op_counter counter;

  EXPECT_TRUE(counter.async_op_start());
  EXPECT_TRUE(counter.async_op_start("watch/read key=", "election/svc/42", " revision=", 7));
  EXPECT_EQ(counter.pending(), 2);

  counter.async_op_done();
  counter.async_op_done("watch/read in hex ", std::hex, 42);
  EXPECT_EQ(counter.pending(), 0);

  EXPECT_TRUE(counter.async_op_start());
  EXPECT_TRUE(counter.async_op_start());

  counter.shutdown();
  EXPECT_TRUE(counter.in_shutdown());
  EXPECT_FALSE(counter.async_op_start());

  std::thread t([&counter]() {
    counter.async_op_done();
    counter.async_op_done();
  });

  counter.block_until_all_done();
  EXPECT_EQ(counter.pending(), 0);
  EXPECT_FALSE(counter.async_op_start());
  t.join();
}

/**
 * @test Verify that ballot::detail::async_op_tracer only counts operations started before shutdown.
 */
TEST(async_op_counter, tracer) {
  ballot::detail::async_op_counter counter;
  {
    ballot::detail::async_op_tracer trace(counter, "store/txn");
    EXPECT_TRUE(bool(trace));
    EXPECT_EQ(counter.pending(), 1);
  }
  EXPECT_EQ(counter.pending(), 0);

  counter.shutdown();
  {
    ballot::detail::async_op_tracer trace(counter, "store/txn");
    EXPECT_FALSE(bool(trace));
    EXPECT_EQ(counter.pending(), 0);
  }
  EXPECT_EQ(counter.pending(), 0);
}
