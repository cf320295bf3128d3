#include "ballot/detail/grpc_errors.hpp"
#include <etcd/etcdserver/etcdserverpb/rpc.pb.h>

#include <gtest/gtest.h>

/**
 * @test Verify that check_grpc_status() does not raise on success.
 */
TEST(grpc_errors, check_grpc_status_ok) {
  using namespace ballot::detail;

  grpc::Status status = grpc::Status::OK;
  ASSERT_NO_THROW(check_grpc_status(status, "test"));

  etcdserverpb::RangeRequest req;
  ASSERT_NO_THROW(check_grpc_status(status, "test", " attempt=", 3, ", request=", print_to_stream(req)));
}

/**
 * @test Verify that check_grpc_status() raises a ballot::store_error with the annotations.
 */
TEST(grpc_errors, check_grpc_status_error_annotations) {
  using namespace ballot::detail;

  etcdserverpb::LeaseRevokeRequest req;
  req.set_id(42);
  try {
    check_grpc_status(grpc::Status(grpc::UNAVAILABLE, "connection refused"), "lease/revoke", " request=",
                      print_to_stream(req));
    FAIL() << "check_grpc_status() should have raised";
  } catch (ballot::store_error const& ex) {
    EXPECT_EQ(ex.code(), grpc::UNAVAILABLE);
    EXPECT_EQ(std::string(ex.what()), "lease/revoke grpc error: connection refused [14] request=ID: 42\n");
  }
}

/**
 * @test Verify that check_grpc_status() works without annotations.
 */
TEST(grpc_errors, check_grpc_status_error_bare) {
  using namespace ballot::detail;
  try {
    check_grpc_status(grpc::Status(grpc::UNKNOWN, "bad thing"), "test");
    FAIL() << "check_grpc_status() should have raised";
  } catch (std::runtime_error const& ex) {
    EXPECT_EQ(std::string(ex.what()), "test grpc error: bad thing [2]");
  }
}

/**
 * @test Verify that print_to_stream() formats protos using the text format.
 */
TEST(grpc_errors, print_to_stream_basic) {
  using namespace ballot::detail;

  etcdserverpb::RangeRequest req;
  req.set_key("election/svc/");
  req.set_limit(1);

  std::ostringstream os;
  os << print_to_stream(req);
  EXPECT_EQ(os.str(), "key: \"election/svc/\"\nlimit: 1\n");
}
