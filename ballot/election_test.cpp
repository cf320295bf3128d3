#include "ballot/election.hpp"
#include <ballot/errors.hpp>
#include <ballot/etcd_store.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <future>
#include <random>

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

std::string unique_name() {
  std::random_device rd;
  return "svc-" + std::to_string(rd());
}
} // anonymous namespace

/**
 * @test Verify that two candidates take turns against a real etcd server.
 */
TEST(election_test, campaign_and_resign) {
  auto store = connect();
  if (not store) {
    GTEST_SKIP() << "etcd server not available";
  }
  auto name = unique_name();
  ballot::election a(store, name, 10s);
  ballot::election b(store, name, 10s);
  EXPECT_THROW(a.get_leader(), ballot::no_leader_error);

  a.campaign("A");
  EXPECT_EQ(a.get_leader(), a.leader_key());
  auto elected = std::async(std::launch::async, [&b]() { b.campaign("B"); });
  EXPECT_EQ(std::future_status::timeout, elected.wait_for(500ms));

  a.proclaim("A2");
  EXPECT_TRUE(a.is_campaigning());
  a.resign();
  ASSERT_EQ(std::future_status::ready, elected.wait_for(10s));
  elected.get();
  EXPECT_EQ(a.get_leader(), b.leader_key());
  b.resign();
  EXPECT_THROW(b.get_leader(), ballot::no_leader_error);
}

/**
 * @test Verify that the observer reports leadership changes against a real etcd server.
 */
TEST(election_test, observer) {
  auto store = connect();
  if (not store) {
    GTEST_SKIP() << "etcd server not available";
  }
  auto name = unique_name();
  ballot::election a(store, name, 10s);
  ballot::election b(store, name, 10s);
  ballot::election observer(store, name, 10s);

  std::mutex mu;
  std::condition_variable cv;
  std::vector<std::string> leaders;
  auto token = observer.subscribe([&](std::string const& key) {
    std::lock_guard<std::mutex> lock(mu);
    leaders.push_back(key);
    cv.notify_one();
  });
  auto wait_for_leaders = [&](std::size_t count) {
    std::unique_lock<std::mutex> lock(mu);
    return cv.wait_for(lock, 10s, [&]() { return leaders.size() >= count; });
  };

  a.campaign("A");
  ASSERT_TRUE(wait_for_leaders(1));
  auto elected = std::async(std::launch::async, [&b]() { b.campaign("B"); });
  a.resign();
  ASSERT_EQ(std::future_status::ready, elected.wait_for(10s));
  elected.get();
  ASSERT_TRUE(wait_for_leaders(2));
  {
    std::lock_guard<std::mutex> lock(mu);
    EXPECT_EQ(leaders.back(), b.leader_key());
  }
  observer.unsubscribe(token);
  b.resign();
}
