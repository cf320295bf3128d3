#include "ballot/assert_throw.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify that BALLOT_ASSERT_THROW() raises only when the predicate is false.
 */
TEST(assert_throw, basic) {
  EXPECT_THROW(ballot::assert_throw_impl("foo", "bar()", "bar.cpp", 20), std::runtime_error);

  EXPECT_THROW(BALLOT_ASSERT_THROW(false), std::runtime_error);
  EXPECT_NO_THROW(BALLOT_ASSERT_THROW(true));
  int revision = 7;
  EXPECT_NO_THROW(BALLOT_ASSERT_THROW(revision > 0));
}

/**
 * @test Verify the exception message describes the predicate and its location.
 */
TEST(assert_throw, message) {
  using namespace ::testing;
  try {
    BALLOT_ASSERT_THROW(2 + 2 == 5);
    FAIL() << "BALLOT_ASSERT_THROW() should have raised";
  } catch (std::runtime_error const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr("2 + 2 == 5"));
    EXPECT_THAT(ex.what(), HasSubstr("assert_throw_ut.cpp"));
  }
}
