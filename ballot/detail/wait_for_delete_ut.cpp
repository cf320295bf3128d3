#include "ballot/detail/wait_for_delete.hpp"
#include <ballot/errors.hpp>
#include <ballot/testing/in_memory_store.hpp>

#include <gmock/gmock.h>

#include <thread>

namespace {
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

/// Block until the store has @a count watches.
void wait_for_watches(ballot::testing::in_memory_store& s, std::size_t count) {
  while (s.active_watches() < count) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
}
} // anonymous namespace

/**
 * @test Verify that ballot::detail::wait_for_delete returns once the key is deleted.
 */
TEST(wait_for_delete, basic) {
  ballot::testing::in_memory_store store;
  put(store, "election/svc/1");
  auto start = store.revision() + 1;

  std::thread t([&store]() {
    wait_for_watches(store, 1);
    put(store, "election/svc/1");
    del(store, "election/svc/1");
  });
  EXPECT_TRUE(ballot::detail::wait_for_delete(store, "election/svc/1", start));
  t.join();
  // ... the watch is always cancelled ...
  EXPECT_EQ(store.active_watches(), 0UL);
}

/**
 * @test Verify that a delete before the watch is created is not missed.
 */
TEST(wait_for_delete, delete_before_watch) {
  ballot::testing::in_memory_store store;
  put(store, "election/svc/1");
  auto start = store.revision() + 1;
  del(store, "election/svc/1");
  EXPECT_TRUE(ballot::detail::wait_for_delete(store, "election/svc/1", start));
  EXPECT_EQ(store.active_watches(), 0UL);
}

/**
 * @test Verify that ballot::detail::wait_for_delete reads the key again when the history is compacted.
 */
TEST(wait_for_delete, compacted) {
  ballot::testing::in_memory_store store;
  put(store, "election/svc/1"); // rev 2
  del(store, "election/svc/1"); // rev 3
  put(store, "election/svc/2"); // rev 4
  put(store, "election/svc/3"); // rev 5
  put(store, "election/svc/4"); // rev 6
  store.compact(6);
  // ... the key is gone, so the wait completes after reading it again ...
  EXPECT_TRUE(ballot::detail::wait_for_delete(store, "election/svc/1", 3));

  // ... the key exists, so the wait restarts after the read ...
  std::thread t([&store]() {
    wait_for_watches(store, 1);
    del(store, "election/svc/2");
  });
  EXPECT_TRUE(ballot::detail::wait_for_delete(store, "election/svc/2", 5));
  t.join();
  EXPECT_EQ(store.active_watches(), 0UL);

  // ... the key was created again after the start revision, the instance we waited for is gone ...
  put(store, "election/svc/1");
  EXPECT_TRUE(ballot::detail::wait_for_delete(store, "election/svc/1", 3));
  EXPECT_EQ(store.active_watches(), 0UL);
}

/**
 * @test Verify that a key deleted and created again is not confused with the original.
 */
TEST(wait_for_delete, recreated) {
  ballot::testing::in_memory_store store;
  put(store, "election/svc/1");
  put(store, "election/svc/2");
  auto start = store.revision() + 1;

  // ... both keys are deleted and created again after the read that listed them ...
  del(store, "election/svc/1");
  put(store, "election/svc/1");
  del(store, "election/svc/2");
  put(store, "election/svc/2");

  // ... the watch replays the delete of the first instance ...
  EXPECT_TRUE(ballot::detail::wait_for_delete(store, "election/svc/1", start));
  // ... and the point read shows a newer creation revision, so no watch is needed ...
  EXPECT_TRUE(ballot::detail::wait_for_deletes(store, {"election/svc/1", "election/svc/2"}, start));
  EXPECT_EQ(store.active_watches(), 0UL);
}

/**
 * @test Verify that watch errors are raised, and the watch is cancelled.
 */
TEST(wait_for_delete, errors) {
  ballot::testing::in_memory_store store;
  put(store, "election/svc/1");
  auto start = store.revision() + 1;

  store.inject_failures("watch", 1);
  EXPECT_THROW(ballot::detail::wait_for_delete(store, "election/svc/1", start), ballot::store_error);

  std::thread t([&store]() {
    wait_for_watches(store, 1);
    store.fail_watches();
  });
  EXPECT_THROW(ballot::detail::wait_for_delete(store, "election/svc/1", start), ballot::store_error);
  t.join();
  EXPECT_EQ(store.active_watches(), 0UL);
}

/**
 * @test Verify that the stop flag interrupts the wait.
 */
TEST(wait_for_delete, stop) {
  ballot::testing::in_memory_store store;
  put(store, "election/svc/1");
  std::atomic<bool> stop(false);
  std::thread t([&store, &stop]() {
    wait_for_watches(store, 1);
    stop.store(true);
  });
  EXPECT_FALSE(ballot::detail::wait_for_delete(store, "election/svc/1", store.revision() + 1, &stop));
  t.join();
  EXPECT_EQ(store.active_watches(), 0UL);
  EXPECT_FALSE(ballot::detail::wait_for_deletes(store, {"election/svc/1"}, store.revision() + 1, &stop));
}

/**
 * @test Verify that ballot::detail::wait_for_deletes skips the keys that do not exist.
 */
TEST(wait_for_delete, wait_for_deletes) {
  ballot::testing::in_memory_store store;
  EXPECT_TRUE(ballot::detail::wait_for_deletes(store, {}, store.revision() + 1));
  EXPECT_TRUE(ballot::detail::wait_for_deletes(store, {"election/svc/1", "election/svc/2"}, store.revision() + 1));
  EXPECT_EQ(store.active_watches(), 0UL);

  put(store, "election/svc/1");
  put(store, "election/svc/2");
  put(store, "election/svc/3");
  auto start = store.revision() + 1;
  std::thread t([&store]() {
    // ... deleting the keys out of order works too ...
    del(store, "election/svc/3");
    wait_for_watches(store, 1);
    del(store, "election/svc/1");
    del(store, "election/svc/2");
  });
  EXPECT_TRUE(
      ballot::detail::wait_for_deletes(store, {"election/svc/2", "election/svc/3", "election/svc/1"}, start));
  t.join();
  EXPECT_EQ(store.active_watches(), 0UL);
}
