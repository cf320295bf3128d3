#include "ballot/election.hpp"
#include <ballot/errors.hpp>
#include <ballot/lease.hpp>
#include <ballot/prefix_end.hpp>
#include <ballot/testing/in_memory_store.hpp>

#include <gmock/gmock.h>

#include <atomic>
#include <future>

/// Define helper types and functions used in these tests
namespace {
using ballot::testing::in_memory_store;

/// Collect the notifications from an election.
class collector {
public:
  long subscribe(ballot::election& e) {
    return e.subscribe(
        [this](std::string const& key) {
          std::lock_guard<std::mutex> lock(mu_);
          leaders_.push_back(key);
          cv_.notify_all();
        },
        [this](std::exception_ptr) {
          std::lock_guard<std::mutex> lock(mu_);
          ++errors_;
          cv_.notify_all();
        });
  }

  bool wait_for_leaders(std::size_t count) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, std::chrono::seconds(5), [this, count]() { return leaders_.size() >= count; });
  }

  bool wait_for_errors(int count) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, std::chrono::seconds(5), [this, count]() { return errors_ >= count; });
  }

  std::vector<std::string> leaders() const {
    std::lock_guard<std::mutex> lock(mu_);
    return leaders_;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::string> leaders_;
  int errors_ = 0;
};

/// Return the value stored in @a key, or an empty string if the key does not exist.
std::string value_of(in_memory_store& s, std::string const& key) {
  etcdserverpb::RangeRequest req;
  req.set_key(key);
  auto resp = s.range(req);
  if (resp.kvs().empty()) {
    return std::string();
  }
  return resp.kvs(0).value();
}

std::int64_t candidates(in_memory_store& s, std::string const& prefix) {
  etcdserverpb::RangeRequest req;
  req.set_key(prefix);
  req.set_range_end(ballot::prefix_end(prefix));
  req.set_count_only(true);
  return s.range(req).count();
}

/// A lease that reports itself inactive, as if it was lost before anybody registered a handler.
class inactive_lease : public ballot::lease {
public:
  explicit inactive_lease(std::shared_ptr<ballot::lease> l)
      : lease_(std::move(l)) {
  }

  std::int64_t lease_id() const override {
    return lease_->lease_id();
  }
  std::chrono::milliseconds actual_TTL() const override {
    return lease_->actual_TTL();
  }
  bool is_active() const override {
    return false;
  }
  void revoke() override {
    lease_->revoke();
  }
  void on_lost(lost_handler handler) override {
    lease_->on_lost(std::move(handler));
  }

private:
  std::shared_ptr<ballot::lease> lease_;
};

/// An in_memory_store where the first lease is lost as soon as it is granted.
class first_lease_lost_store : public ballot::store {
public:
  etcdserverpb::TxnResponse txn(etcdserverpb::TxnRequest const& req) override {
    return store_.txn(req);
  }
  etcdserverpb::RangeResponse range(etcdserverpb::RangeRequest const& req) override {
    return store_.range(req);
  }
  etcdserverpb::PutResponse put(etcdserverpb::PutRequest const& req) override {
    return store_.put(req);
  }
  etcdserverpb::DeleteRangeResponse delete_range(etcdserverpb::DeleteRangeRequest const& req) override {
    return store_.delete_range(req);
  }
  std::shared_ptr<ballot::lease> grant_lease(std::chrono::seconds ttl) override {
    auto l = store_.grant_lease(ttl);
    if (granted_++ == 0) {
      return std::make_shared<inactive_lease>(std::move(l));
    }
    return l;
  }
  std::unique_ptr<ballot::watcher>
  watch(etcdserverpb::WatchCreateRequest const& req, event_handler on_event, error_handler on_error) override {
    return store_.watch(req, std::move(on_event), std::move(on_error));
  }

  int granted() const {
    return granted_.load();
  }

private:
  in_memory_store store_;
  std::atomic<int> granted_{0};
};

/// Block until the predicate is true, or fail after a few seconds.
template <typename Predicate>
bool eventually(Predicate&& p) {
  for (int i = 0; i != 500; ++i) {
    if (p()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}
} // anonymous namespace

/**
 * @test Verify that a single candidate wins the election immediately.
 */
TEST(election, campaign_basic) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc", std::chrono::seconds(60));
  EXPECT_EQ(e.name(), "svc");
  EXPECT_EQ(e.prefix(), "election/svc/");
  EXPECT_EQ(e.ttl().count(), 60);
  EXPECT_FALSE(e.is_ready());
  EXPECT_FALSE(e.is_campaigning());
  EXPECT_FALSE(e.is_observing());
  EXPECT_THROW(e.get_leader(), ballot::no_leader_error);

  e.campaign("A");
  EXPECT_TRUE(e.is_ready());
  EXPECT_TRUE(e.is_campaigning());
  auto key = "election/svc/" + std::to_string(e.lease_id());
  EXPECT_EQ(e.leader_key(), key);
  EXPECT_EQ(e.leader_revision(), 2);
  EXPECT_EQ(e.get_leader(), key);
  EXPECT_EQ(value_of(*store, key), "A");

  // ... initialize() is idempotent ...
  auto id = e.lease_id();
  e.initialize();
  EXPECT_EQ(e.lease_id(), id);
  EXPECT_EQ(store->active_leases(), 1UL);
}

/**
 * @test Verify that the namespace is configurable.
 */
TEST(election, namespace_prefix) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc", std::chrono::seconds(10), "jobs");
  EXPECT_EQ(e.prefix(), "jobs/svc/");
  e.campaign("A");
  EXPECT_EQ(e.get_leader(), "jobs/svc/" + std::to_string(e.lease_id()));

  ballot::election other(store, "svc");
  EXPECT_THROW(other.get_leader(), ballot::no_leader_error);
}

/**
 * @test Verify that proclaim() updates the value and preserves the leadership.
 */
TEST(election, proclaim) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");
  EXPECT_THROW(e.proclaim("v0"), ballot::not_leader_error);

  e.campaign("v1");
  auto revision = e.leader_revision();
  e.proclaim("v2");
  EXPECT_TRUE(e.is_campaigning());
  EXPECT_EQ(e.leader_revision(), revision);

  ballot::election reader(store, "svc");
  auto leader = reader.get_leader();
  EXPECT_EQ(leader, e.leader_key());
  EXPECT_EQ(value_of(*store, leader), "v2");
  EXPECT_FALSE(reader.is_ready());
}

/**
 * @test Verify that campaigning again with the same lease keeps the position in the election.
 */
TEST(election, campaign_again) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");
  e.campaign("A");
  auto key = e.leader_key();
  auto revision = e.leader_revision();

  e.campaign("A");
  EXPECT_EQ(e.leader_key(), key);
  EXPECT_EQ(e.leader_revision(), revision);
  auto rev = store->revision();

  // ... a different value is proclaimed ...
  e.campaign("B");
  EXPECT_EQ(e.leader_revision(), revision);
  EXPECT_EQ(value_of(*store, key), "B");
  EXPECT_EQ(store->revision(), rev + 1);
}

/**
 * @test Verify that resign() deletes the candidate key and is idempotent.
 */
TEST(election, resign) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");
  EXPECT_NO_THROW(e.resign());

  e.campaign("A");
  auto key = e.leader_key();
  e.resign();
  EXPECT_FALSE(e.is_campaigning());
  EXPECT_EQ(e.leader_key(), "");
  EXPECT_EQ(e.leader_revision(), 0);
  EXPECT_EQ(value_of(*store, key), "");
  EXPECT_THROW(e.get_leader(), ballot::no_leader_error);
  // ... the lease is kept for the next campaign ...
  EXPECT_TRUE(e.is_ready());

  auto rev = store->revision();
  e.resign();
  EXPECT_EQ(store->revision(), rev);
}

/**
 * @test Verify that resign() revokes the lease when the candidate key is gone.
 */
TEST(election, resign_revokes_lease) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");
  e.campaign("A");

  etcdserverpb::DeleteRangeRequest del;
  del.set_key(e.leader_key());
  store->delete_range(del);

  e.resign();
  EXPECT_FALSE(e.is_campaigning());
  EXPECT_FALSE(e.is_ready());
  EXPECT_EQ(e.lease_id(), 0);
  EXPECT_EQ(store->active_leases(), 0UL);

  // ... the next campaign obtains a new lease ...
  e.campaign("A");
  EXPECT_TRUE(e.is_ready());
  EXPECT_EQ(store->active_leases(), 1UL);
}

/**
 * @test Verify that later candidates wait until the earlier ones resign.
 */
TEST(election, fairness) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election a(store, "svc");
  ballot::election b(store, "svc");
  a.campaign("A");

  auto elected = std::async(std::launch::async, [&b]() { b.campaign("B"); });
  ASSERT_TRUE(eventually([&b]() { return b.is_campaigning(); }));
  EXPECT_EQ(std::future_status::timeout, elected.wait_for(std::chrono::milliseconds(100)));
  EXPECT_GT(b.leader_revision(), a.leader_revision());
  EXPECT_EQ(a.get_leader(), a.leader_key());

  a.resign();
  ASSERT_EQ(std::future_status::ready, elected.wait_for(std::chrono::seconds(5)));
  EXPECT_NO_THROW(elected.get());
  EXPECT_EQ(b.get_leader(), b.leader_key());
  EXPECT_EQ(value_of(*store, b.leader_key()), "B");
}

/**
 * @test Verify that an expired lease hands over the leadership.
 */
TEST(election, lease_expiration) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election a(store, "svc");
  ballot::election b(store, "svc");
  ballot::election c(store, "svc");
  a.campaign("A");
  auto b_elected = std::async(std::launch::async, [&b]() { b.campaign("B"); });
  ASSERT_TRUE(eventually([&b]() { return b.is_campaigning(); }));
  auto c_elected = std::async(std::launch::async, [&c]() { c.campaign("C"); });
  ASSERT_TRUE(eventually([&c]() { return c.is_campaigning(); }));

  // ... c waits for both a and b ...
  store->expire_lease(a.lease_id());
  ASSERT_EQ(std::future_status::ready, b_elected.wait_for(std::chrono::seconds(5)));
  b_elected.get();
  EXPECT_EQ(std::future_status::timeout, c_elected.wait_for(std::chrono::milliseconds(100)));

  b.resign();
  ASSERT_EQ(std::future_status::ready, c_elected.wait_for(std::chrono::seconds(5)));
  c_elected.get();
  EXPECT_EQ(c.get_leader(), c.leader_key());
}

/**
 * @test Verify that a candidate going back in line with the same lease does not block later candidates.
 */
TEST(election, campaign_again_after_resign) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election a(store, "svc");
  ballot::election b(store, "svc");
  ballot::election c(store, "svc");
  a.campaign("A");
  auto b_elected = std::async(std::launch::async, [&b]() { b.campaign("B"); });
  ASSERT_TRUE(eventually([&b]() { return b.is_campaigning(); }));
  auto c_elected = std::async(std::launch::async, [&c]() { c.campaign("C"); });
  ASSERT_TRUE(eventually([&c]() { return c.is_campaigning(); }));

  // ... a keeps its lease, so the new candidate key has the same name as the old one ...
  auto key = a.leader_key();
  a.resign();
  EXPECT_TRUE(a.is_ready());
  auto a_elected = std::async(std::launch::async, [&a]() { a.campaign("A"); });
  ASSERT_TRUE(eventually([&a]() { return a.is_campaigning(); }));
  EXPECT_EQ(a.leader_key(), key);
  EXPECT_GT(a.leader_revision(), c.leader_revision());

  ASSERT_EQ(std::future_status::ready, b_elected.wait_for(std::chrono::seconds(5)));
  b_elected.get();
  b.resign();
  ASSERT_EQ(std::future_status::ready, c_elected.wait_for(std::chrono::seconds(5)));
  c_elected.get();
  EXPECT_EQ(c.get_leader(), c.leader_key());
  EXPECT_EQ(std::future_status::timeout, a_elected.wait_for(std::chrono::milliseconds(100)));

  c.resign();
  ASSERT_EQ(std::future_status::ready, a_elected.wait_for(std::chrono::seconds(5)));
  a_elected.get();
  EXPECT_EQ(a.get_leader(), key);
  a.resign();
}

/**
 * @test Verify that at most one candidate is the leader at any time.
 */
TEST(election, mutual_exclusion) {
  auto store = std::make_shared<in_memory_store>();
  std::atomic<int> leaders(0);
  std::atomic<int> max_leaders(0);
  std::atomic<int> terms(0);
  auto candidate = [&](std::string const& value) {
    ballot::election e(store, "svc");
    for (int i = 0; i != 5; ++i) {
      e.campaign(value);
      auto count = ++leaders;
      int expected = max_leaders.load();
      while (count > expected and not max_leaders.compare_exchange_weak(expected, count)) {
      }
      EXPECT_EQ(e.get_leader(), e.leader_key());
      std::this_thread::sleep_for(std::chrono::milliseconds(2));
      --leaders;
      ++terms;
      e.resign();
    }
  };
  std::vector<std::thread> threads;
  for (auto const& v : {"A", "B", "C", "D"}) {
    threads.emplace_back(candidate, v);
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(max_leaders.load(), 1);
  EXPECT_EQ(terms.load(), 20);
  EXPECT_EQ(candidates(*store, "election/svc/"), 0);
}

/**
 * @test Verify that a failed campaign resigns before raising the exception.
 */
TEST(election, campaign_failures) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");

  store->inject_failures("grant_lease", 1);
  EXPECT_THROW(e.campaign("A"), ballot::store_error);
  EXPECT_FALSE(e.is_ready());
  EXPECT_FALSE(e.is_campaigning());

  store->inject_failures("txn", 1);
  EXPECT_THROW(e.campaign("A"), ballot::store_error);
  EXPECT_TRUE(e.is_ready());
  EXPECT_FALSE(e.is_campaigning());
  EXPECT_EQ(candidates(*store, "election/svc/"), 0);

  // ... the candidate key is created, then waiting for the earlier candidates fails ...
  store->inject_failures("range", 1);
  EXPECT_THROW(e.campaign("A"), ballot::store_error);
  EXPECT_FALSE(e.is_campaigning());
  EXPECT_EQ(e.leader_key(), "");
  EXPECT_EQ(candidates(*store, "election/svc/"), 0);

  // ... a failure in the watch also resigns ...
  ballot::election leader(store, "svc");
  leader.campaign("L");
  store->inject_failures("watch", 1);
  EXPECT_THROW(e.campaign("A"), ballot::store_error);
  EXPECT_FALSE(e.is_campaigning());
  EXPECT_EQ(candidates(*store, "election/svc/"), 1);

  leader.resign();
  e.campaign("A");
  EXPECT_TRUE(e.is_campaigning());
}

/**
 * @test Verify that the election recovers from a lost lease.
 */
TEST(election, lease_lost) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");
  e.campaign("A");
  auto id = e.lease_id();

  store->expire_lease(id);
  EXPECT_NE(e.lease_id(), id);
  EXPECT_THROW(e.proclaim("B"), ballot::not_leader_error);
  ASSERT_TRUE(eventually([&e]() { return e.is_ready(); }));
  EXPECT_NE(e.lease_id(), id);
  EXPECT_NO_THROW(e.initialize());
  EXPECT_EQ(store->active_leases(), 1UL);

  // ... the application must campaign again ...
  EXPECT_TRUE(e.is_campaigning());
  e.resign();
  e.campaign("A");
  EXPECT_EQ(e.get_leader(), "election/svc/" + std::to_string(e.lease_id()));
}

/**
 * @test Verify that proclaim() fails once the lease is lost, even if the candidate key is still in the store.
 */
TEST(election, lease_lost_before_expiration) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");
  e.campaign("A");
  auto id = e.lease_id();
  auto key = e.leader_key();

  store->lose_lease(id);
  EXPECT_NE(e.lease_id(), id);
  EXPECT_EQ(e.leader_key(), "");
  EXPECT_TRUE(e.is_campaigning());
  EXPECT_THROW(e.proclaim("B"), ballot::not_leader_error);
  EXPECT_EQ(value_of(*store, key), "A");
  ASSERT_TRUE(eventually([&e]() { return e.is_ready(); }));

  // ... the old key goes away when the server expires the lease ...
  store->expire_lease(id);
  e.resign();
  EXPECT_FALSE(e.is_campaigning());
  e.campaign("B");
  EXPECT_EQ(e.get_leader(), e.leader_key());
  EXPECT_EQ(value_of(*store, e.leader_key()), "B");
}

/**
 * @test Verify that a lease lost before the election registers its handler is replaced.
 */
TEST(election, lease_lost_during_initialize) {
  auto store = std::make_shared<first_lease_lost_store>();
  ballot::election e(store, "svc");
  e.initialize();
  ASSERT_TRUE(eventually([&store, &e]() { return store->granted() == 2 and e.is_ready(); }));

  e.campaign("A");
  EXPECT_EQ(e.get_leader(), e.leader_key());
  EXPECT_EQ(store->granted(), 2);
}

/**
 * @test Verify that failures to recover a lost lease are reported to the subscribers.
 */
TEST(election, lease_recovery_failure) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election e(store, "svc");
  collector c;
  c.subscribe(e);
  e.initialize();

  store->inject_failures("grant_lease", 1);
  store->expire_lease(e.lease_id());
  ASSERT_TRUE(c.wait_for_errors(1));
  EXPECT_FALSE(e.is_ready());

  e.initialize();
  EXPECT_TRUE(e.is_ready());
}

/**
 * @test Verify that the observer reports the leadership changes in an end-to-end scenario.
 */
TEST(election, observer_sequencing) {
  auto store = std::make_shared<in_memory_store>();
  ballot::election a(store, "svc", std::chrono::seconds(60));
  ballot::election b(store, "svc", std::chrono::seconds(60));
  ballot::election observer(store, "svc", std::chrono::seconds(60));

  collector c;
  auto token = c.subscribe(observer);
  EXPECT_TRUE(observer.is_observing());
  a.campaign("A");
  ASSERT_TRUE(c.wait_for_leaders(1));
  EXPECT_THAT(c.leaders(), ::testing::ElementsAre(a.leader_key()));

  auto elected = std::async(std::launch::async, [&b]() { b.campaign("B"); });
  ASSERT_TRUE(eventually([&b]() { return b.is_campaigning(); }));
  a.resign();
  ASSERT_EQ(std::future_status::ready, elected.wait_for(std::chrono::seconds(5)));
  elected.get();
  ASSERT_TRUE(c.wait_for_leaders(2));
  // ... give the observer a chance to report anything unexpected ...
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  EXPECT_THAT(c.leaders(), ::testing::ElementsAre("election/svc/" + std::to_string(a.lease_id()), b.leader_key()));

  // ... late subscribers receive the current leader before subscribe() returns ...
  collector late;
  late.subscribe(observer);
  EXPECT_THAT(late.leaders(), ::testing::ElementsAre(b.leader_key()));

  observer.unsubscribe(token);
  EXPECT_THROW(observer.unsubscribe(token), std::invalid_argument);
}

/**
 * @test Verify that the destructor does not resign.
 */
TEST(election, destructor_keeps_candidacy) {
  auto store = std::make_shared<in_memory_store>();
  std::string key;
  {
    ballot::election e(store, "svc");
    e.campaign("A");
    key = e.leader_key();
  }
  EXPECT_EQ(value_of(*store, key), "A");
  ballot::election other(store, "svc");
  EXPECT_EQ(other.get_leader(), key);
}
