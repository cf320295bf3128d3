#include "ballot/log_sink.hpp"

#include <gtest/gtest.h>

/**
 * @test Verify that ballot::make_log_sink() forwards to the functor.
 */
TEST(log_sink, basic) {
  std::string value;
  ballot::severity sev = ballot::severity::trace;
  auto ls = ballot::make_log_sink([&value, &sev](ballot::severity s, std::string&& m) {
    value = std::move(m);
    sev = s;
  });

  ls->log(ballot::severity::warning, std::string("lease lost"));
  EXPECT_EQ(sev, ballot::severity::warning);
  EXPECT_EQ(value, "lease lost");
}
