#include "ballot/log_severity.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify the ordering and streaming of ballot::severity.
 */
TEST(log_severity, base) {
  EXPECT_LT(ballot::severity::LOWEST, ballot::severity::HIGHEST);
  EXPECT_LE(ballot::severity::LOWEST, ballot::severity::LOWEST_ENABLED);

  using s = ballot::severity;
  std::ostringstream os;
  os << s::trace << " " << s::debug << " " << s::info << " " << s::notice << " " << s::warning << " " << s::error
     << " " << s::critical << " " << s::alert << " " << s::fatal;
  EXPECT_EQ(os.str(), "trace debug info notice warning error critical alert fatal");
}
