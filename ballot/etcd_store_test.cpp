#include "ballot/etcd_store.hpp"
#include <ballot/errors.hpp>
#include <ballot/prefix_end.hpp>

#include <gtest/gtest.h>

#include <condition_variable>
#include <cstdlib>
#include <random>
#include <thread>

/// Define helper types and functions used in these tests
namespace {
using namespace std::chrono_literals;

/// Connect to the test etcd server, returns null if it is not reachable.
std::shared_ptr<ballot::etcd_store> connect() {
  char const* env = std::getenv("BALLOT_ETCD_ADDRESS");
  std::string const address = env == nullptr ? "localhost:22379" : env;
  auto channel = grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  if (not channel->WaitForConnected(std::chrono::system_clock::now() + 2s)) {
    return std::shared_ptr<ballot::etcd_store>();
  }
  return std::make_shared<ballot::etcd_store>(channel, std::make_shared<ballot::active_completion_queue>());
}

/// A prefix that does not collide with other runs of the tests.
std::string unique_prefix() {
  std::random_device rd;
  return "ballot-test/" + std::to_string(rd()) + "/";
}

etcdserverpb::PutRequest make_put(std::string const& key, std::string const& value, std::int64_t lease = 0) {
  etcdserverpb::PutRequest req;
  req.set_key(key);
  req.set_value(value);
  req.set_lease(lease);
  return req;
}

etcdserverpb::RangeRequest make_range(std::string const& key) {
  etcdserverpb::RangeRequest req;
  req.set_key(key);
  return req;
}
} // anonymous namespace

/**
 * @test Verify that the basic KV operations work against a real etcd server.
 */
TEST(etcd_store_test, kv_operations) {
  auto store = connect();
  if (not store) {
    GTEST_SKIP() << "etcd server not available";
  }
  auto prefix = unique_prefix();
  auto put = store->put(make_put(prefix + "a", "1"));
  EXPECT_GT(put.header().revision(), 0);

  auto range = store->range(make_range(prefix + "a"));
  ASSERT_EQ(range.kvs_size(), 1);
  EXPECT_EQ(range.kvs(0).value(), "1");
  EXPECT_EQ(range.kvs(0).create_revision(), put.header().revision());

  etcdserverpb::TxnRequest txn;
  auto& cmp = *txn.add_compare();
  cmp.set_key(prefix + "a");
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_result(etcdserverpb::Compare::EQUAL);
  cmp.set_create_revision(0);
  *txn.add_success()->mutable_request_put() = make_put(prefix + "a", "2");
  txn.add_failure()->mutable_request_range()->set_key(prefix + "a");
  auto resp = store->txn(txn);
  EXPECT_FALSE(resp.succeeded());
  ASSERT_EQ(resp.responses_size(), 1);
  EXPECT_EQ(resp.responses(0).response_range().kvs(0).value(), "1");

  etcdserverpb::DeleteRangeRequest del;
  del.set_key(prefix);
  del.set_range_end(ballot::prefix_end(prefix));
  EXPECT_EQ(store->delete_range(del).deleted(), 1);
}

/**
 * @test Verify that leases are kept alive, and revoking them deletes their keys.
 */
TEST(etcd_store_test, leases) {
  auto store = connect();
  if (not store) {
    GTEST_SKIP() << "etcd server not available";
  }
  auto prefix = unique_prefix();
  auto lease = store->grant_lease(2s);
  ASSERT_NE(lease->lease_id(), 0);
  EXPECT_TRUE(lease->is_active());
  bool lost = false;
  lease->on_lost([&lost]() { lost = true; });
  store->put(make_put(prefix + "a", "1", lease->lease_id()));

  // ... longer than the TTL, the keep alives must work ...
  std::this_thread::sleep_for(3s);
  EXPECT_TRUE(lease->is_active());
  EXPECT_EQ(store->range(make_range(prefix + "a")).kvs_size(), 1);

  lease->revoke();
  EXPECT_FALSE(lease->is_active());
  EXPECT_FALSE(lost);
  EXPECT_EQ(store->range(make_range(prefix + "a")).kvs_size(), 0);
  EXPECT_NO_THROW(lease.reset());
}

/**
 * @test Verify that watches receive the events in order.
 */
TEST(etcd_store_test, watch) {
  auto store = connect();
  if (not store) {
    GTEST_SKIP() << "etcd server not available";
  }
  auto prefix = unique_prefix();
  std::mutex mu;
  std::condition_variable cv;
  std::vector<std::string> events;

  auto start = store->range(make_range(prefix)).header().revision() + 1;
  etcdserverpb::WatchCreateRequest req;
  req.set_key(prefix);
  req.set_range_end(ballot::prefix_end(prefix));
  req.set_start_revision(start);
  auto watcher = store->watch(
      req,
      [&](mvccpb::Event const& ev) {
        std::lock_guard<std::mutex> lock(mu);
        events.push_back((ev.type() == mvccpb::Event::PUT ? "PUT " : "DELETE ") + ev.kv().key());
        cv.notify_one();
      },
      [](std::exception_ptr) {});

  store->put(make_put(prefix + "a", "1"));
  store->put(make_put(prefix + "b", "1"));
  etcdserverpb::DeleteRangeRequest del;
  del.set_key(prefix + "a");
  store->delete_range(del);

  {
    std::unique_lock<std::mutex> lock(mu);
    ASSERT_TRUE(cv.wait_for(lock, 5s, [&events]() { return events.size() >= 3; }));
    EXPECT_EQ(events[0], "PUT " + prefix + "a");
    EXPECT_EQ(events[1], "PUT " + prefix + "b");
    EXPECT_EQ(events[2], "DELETE " + prefix + "a");
  }
  EXPECT_NO_THROW(watcher->cancel());
  del.set_key(prefix + "b");
  store->delete_range(del);
}
