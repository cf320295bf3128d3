#include "ballot/prefix_end.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify that ballot::prefix_end works for typical election prefixes.
 */
TEST(prefix_end, basic) {
  EXPECT_EQ(ballot::prefix_end("election/svc/"), std::string("election/svc0"));
  EXPECT_EQ(ballot::prefix_end("a"), std::string("b"));
}

/**
 * @test Verify that ballot::prefix_end handles trailing 0xFF bytes.
 */
TEST(prefix_end, carry) {
  using namespace ::testing;
  EXPECT_THAT(ballot::prefix_end("ABC\xFF"), ElementsAre('A', 'B', 'D'));
  EXPECT_THAT(ballot::prefix_end("A\xFF\xFF"), ElementsAre('B'));
}

/**
 * @test Verify that ballot::prefix_end returns the "all keys" marker when there is no upper bound.
 */
TEST(prefix_end, unbounded) {
  std::string const all_keys(1, '\0');
  EXPECT_EQ(ballot::prefix_end("\xFF\xFF"), all_keys);
  EXPECT_EQ(ballot::prefix_end(""), all_keys);
}
