#include "ballot/detail/leader_observer.hpp"
#include <ballot/errors.hpp>
#include <ballot/testing/in_memory_store.hpp>

#include <gmock/gmock.h>

#include <condition_variable>
#include <thread>

/// Define helper types and functions used in these tests
namespace {
/// Collect the notifications from a leader_observer.
class collector {
public:
  void on_leader(std::string const& key) {
    std::lock_guard<std::mutex> lock(mu_);
    leaders_.push_back(key);
    cv_.notify_all();
  }

  void on_error(std::exception_ptr) {
    std::lock_guard<std::mutex> lock(mu_);
    ++errors_;
    cv_.notify_all();
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

  int errors() const {
    std::lock_guard<std::mutex> lock(mu_);
    return errors_;
  }

  long subscribe(ballot::detail::leader_observer& observer) {
    return observer.subscribe(
        [this](std::string const& key) { this->on_leader(key); },
        [this](std::exception_ptr ex) { this->on_error(ex); });
  }

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::vector<std::string> leaders_;
  int errors_ = 0;
};

void put(ballot::testing::in_memory_store& s, std::string const& key) {
  etcdserverpb::PutRequest req;
  req.set_key(key);
  req.set_value("v");
  s.put(req);
}

void del(ballot::testing::in_memory_store& s, std::string const& key) {
  etcdserverpb::DeleteRangeRequest req;
  req.set_key(key);
  s.delete_range(req);
}

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

std::unique_ptr<ballot::detail::leader_observer> make_observer(std::shared_ptr<ballot::testing::in_memory_store> s) {
  return std::unique_ptr<ballot::detail::leader_observer>(new ballot::detail::leader_observer(
      std::move(s), "election/svc/", std::chrono::milliseconds(1), std::chrono::milliseconds(20)));
}
} // anonymous namespace

/**
 * @test Verify that ballot::detail::leader_observer reports each leader in creation order.
 */
TEST(leader_observer, basic) {
  auto store = std::make_shared<ballot::testing::in_memory_store>();
  put(*store, "election/svc/2");
  put(*store, "election/svc/1");
  put(*store, "election/svd/0");

  auto observer = make_observer(store);
  EXPECT_FALSE(observer->is_observing());
  collector c;
  auto token = c.subscribe(*observer);
  EXPECT_TRUE(observer->is_observing());
  ASSERT_TRUE(c.wait_for_leaders(1));
  EXPECT_EQ(c.leaders()[0], "election/svc/2");
  EXPECT_EQ(observer->current_leader(), "election/svc/2");

  // ... updating the value of the leader is not a change of leadership ...
  put(*store, "election/svc/2");
  del(*store, "election/svc/2");
  ASSERT_TRUE(c.wait_for_leaders(2));
  EXPECT_EQ(c.leaders()[1], "election/svc/1");

  // ... the loop stops once the current leader is gone and there are no subscribers ...
  observer->unsubscribe(token);
  EXPECT_TRUE(observer->is_observing());
  del(*store, "election/svc/1");
  EXPECT_TRUE(eventually([&observer]() { return not observer->is_observing(); }));
  EXPECT_TRUE(eventually([&store]() { return store->active_watches() == 0; }));
  EXPECT_THAT(c.leaders(), ::testing::ElementsAre("election/svc/2", "election/svc/1"));
  EXPECT_EQ(c.errors(), 0);
}

/**
 * @test Verify that ballot::detail::leader_observer waits for the first candidate in an empty election.
 */
TEST(leader_observer, empty_election) {
  auto store = std::make_shared<ballot::testing::in_memory_store>();
  auto observer = make_observer(store);
  collector c;
  c.subscribe(*observer);
  ASSERT_TRUE(eventually([&store]() { return store->active_watches() == 1; }));
  EXPECT_TRUE(c.leaders().empty());

  put(*store, "election/other");
  put(*store, "election/svc/7");
  put(*store, "election/svc/3");
  ASSERT_TRUE(c.wait_for_leaders(1));
  EXPECT_EQ(c.leaders()[0], "election/svc/7");

  del(*store, "election/svc/7");
  ASSERT_TRUE(c.wait_for_leaders(2));
  EXPECT_EQ(c.leaders()[1], "election/svc/3");

  // ... the leader is gone before the observer can wait for it ...
  del(*store, "election/svc/3");
  put(*store, "election/svc/4");
  del(*store, "election/svc/4");
  put(*store, "election/svc/5");
  ASSERT_TRUE(eventually([&c]() { return c.leaders().back() == "election/svc/5"; }));

  observer->shutdown();
  EXPECT_FALSE(observer->is_observing());
  EXPECT_EQ(store->active_watches(), 0UL);
}

/**
 * @test Verify that new subscribers receive the current leader.
 */
TEST(leader_observer, replay_current_leader) {
  auto store = std::make_shared<ballot::testing::in_memory_store>();
  put(*store, "election/svc/1");
  auto observer = make_observer(store);
  collector c0;
  c0.subscribe(*observer);
  ASSERT_TRUE(c0.wait_for_leaders(1));

  collector c1;
  auto token = c1.subscribe(*observer);
  // ... delivered before subscribe() returns ...
  EXPECT_THAT(c1.leaders(), ::testing::ElementsAre("election/svc/1"));
  observer->unsubscribe(token);
  EXPECT_THROW(observer->unsubscribe(token), std::invalid_argument);

  put(*store, "election/svc/2");
  del(*store, "election/svc/1");
  ASSERT_TRUE(c0.wait_for_leaders(2));
  EXPECT_EQ(c1.leaders().size(), 1UL);
}

/**
 * @test Verify that errors are reported and the loop recovers.
 */
TEST(leader_observer, errors) {
  auto store = std::make_shared<ballot::testing::in_memory_store>();
  put(*store, "election/svc/1");
  store->inject_failures("range", 3);

  auto observer = make_observer(store);
  collector c;
  c.subscribe(*observer);
  ASSERT_TRUE(c.wait_for_leaders(1));
  EXPECT_EQ(c.errors(), 3);
  EXPECT_EQ(c.leaders()[0], "election/svc/1");

  // ... a broken watch is reported, and the leader is reported again ...
  ASSERT_TRUE(eventually([&store]() { return store->active_watches() == 1; }));
  store->fail_watches();
  ASSERT_TRUE(c.wait_for_errors(4));
  ASSERT_TRUE(c.wait_for_leaders(2));
  EXPECT_EQ(c.leaders()[1], "election/svc/1");

  // ... errors reported by the election are delivered too ...
  observer->report_error(std::make_exception_ptr(ballot::store_error("lease recovery failed")));
  EXPECT_EQ(c.errors(), 5);
}

/**
 * @test Verify that exceptions raised by subscribers do not stop the loop.
 */
TEST(leader_observer, subscriber_exceptions) {
  auto store = std::make_shared<ballot::testing::in_memory_store>();
  put(*store, "election/svc/1");
  auto observer = make_observer(store);
  observer->subscribe(
      [](std::string const&) { throw std::runtime_error("bad subscriber"); },
      [](std::exception_ptr) { throw std::runtime_error("bad subscriber"); });
  collector c;
  c.subscribe(*observer);
  ASSERT_TRUE(c.wait_for_leaders(1));

  put(*store, "election/svc/2");
  del(*store, "election/svc/1");
  ASSERT_TRUE(c.wait_for_leaders(2));
  EXPECT_NO_THROW(observer->report_error(std::make_exception_ptr(ballot::store_error("test"))));
  EXPECT_EQ(c.errors(), 1);
}
