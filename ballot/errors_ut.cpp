#include "ballot/errors.hpp"

#include <gmock/gmock.h>

/**
 * @test Verify the election errors can be caught by their common base class.
 */
TEST(errors, election_errors) {
  using namespace ::testing;
  try {
    throw ballot::no_leader_error("election/svc/");
  } catch (ballot::election_error const& ex) {
    EXPECT_THAT(ex.what(), HasSubstr("election/svc/"));
  }
  EXPECT_THROW(throw ballot::not_leader_error("lost"), ballot::election_error);
  EXPECT_THROW(throw ballot::not_leader_error("lost"), std::runtime_error);
}

/**
 * @test Verify ballot::store_error and ballot::compacted_error carry their details.
 */
TEST(errors, store_errors) {
  ballot::store_error unavailable("Txn failed", grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(unavailable.code(), grpc::StatusCode::UNAVAILABLE);
  EXPECT_EQ(std::string(unavailable.what()), "Txn failed");

  ballot::store_error plain("watch closed");
  EXPECT_EQ(plain.code(), grpc::StatusCode::UNKNOWN);

  try {
    throw ballot::compacted_error("watch canceled", 42);
  } catch (ballot::store_error const& ex) {
    auto const* compacted = dynamic_cast<ballot::compacted_error const*>(&ex);
    ASSERT_TRUE(compacted != nullptr);
    EXPECT_EQ(compacted->compact_revision(), 42);
    EXPECT_EQ(std::string(ex.what()), "watch canceled compact_revision=42");
  }
}
