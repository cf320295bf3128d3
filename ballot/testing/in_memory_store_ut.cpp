#include "ballot/testing/in_memory_store.hpp"
#include <ballot/errors.hpp>

#include <gmock/gmock.h>

#include <vector>

namespace {
etcdserverpb::PutRequest make_put(std::string const& key, std::string const& value, std::int64_t lease = 0) {
  etcdserverpb::PutRequest req;
  req.set_key(key);
  req.set_value(value);
  req.set_lease(lease);
  return req;
}

etcdserverpb::RangeRequest make_range(std::string const& key, std::string const& range_end = std::string()) {
  etcdserverpb::RangeRequest req;
  req.set_key(key);
  req.set_range_end(range_end);
  return req;
}

/// Create the candidate key if it does not exist, otherwise read it.
etcdserverpb::TxnRequest make_campaign(std::string const& key, std::string const& value, std::int64_t lease) {
  etcdserverpb::TxnRequest req;
  auto& cmp = *req.add_compare();
  cmp.set_key(key);
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_result(etcdserverpb::Compare::EQUAL);
  cmp.set_create_revision(0);
  *req.add_success()->mutable_request_put() = make_put(key, value, lease);
  *req.add_failure()->mutable_request_range() = make_range(key);
  return req;
}

etcdserverpb::WatchCreateRequest make_watch(std::string const& key, std::string const& range_end = std::string()) {
  etcdserverpb::WatchCreateRequest req;
  req.set_key(key);
  req.set_range_end(range_end);
  return req;
}
} // anonymous namespace

/**
 * @test Verify that revisions, versions, and create revisions follow the etcd rules.
 */
TEST(in_memory_store, revisions) {
  ballot::testing::in_memory_store store;
  EXPECT_EQ(store.revision(), 1);

  auto r0 = store.put(make_put("foo", "1"));
  EXPECT_EQ(r0.header().revision(), 2);
  auto r1 = store.put(make_put("foo", "2"));
  EXPECT_EQ(r1.header().revision(), 3);
  store.put(make_put("bar", "1"));

  auto resp = store.range(make_range("foo"));
  EXPECT_EQ(resp.header().revision(), 4);
  ASSERT_EQ(resp.kvs_size(), 1);
  EXPECT_EQ(resp.kvs(0).value(), "2");
  EXPECT_EQ(resp.kvs(0).create_revision(), 2);
  EXPECT_EQ(resp.kvs(0).mod_revision(), 3);
  EXPECT_EQ(resp.kvs(0).version(), 2);

  // ... deleting a missing key does not change the revision ...
  etcdserverpb::DeleteRangeRequest del;
  del.set_key("baz");
  EXPECT_EQ(store.delete_range(del).deleted(), 0);
  EXPECT_EQ(store.revision(), 4);

  del.set_key("foo");
  EXPECT_EQ(store.delete_range(del).deleted(), 1);
  EXPECT_EQ(store.revision(), 5);
  EXPECT_EQ(store.range(make_range("foo")).kvs_size(), 0);

  // ... a new incarnation of the key gets a new create revision ...
  store.put(make_put("foo", "3"));
  resp = store.range(make_range("foo"));
  ASSERT_EQ(resp.kvs_size(), 1);
  EXPECT_EQ(resp.kvs(0).create_revision(), 6);
  EXPECT_EQ(resp.kvs(0).version(), 1);
}

/**
 * @test Verify that range reads support sorting, limits, and revision filters.
 */
TEST(in_memory_store, range_filters) {
  ballot::testing::in_memory_store store;
  store.put(make_put("election/svc/3", "c")); // rev 2
  store.put(make_put("election/svc/1", "a")); // rev 3
  store.put(make_put("election/svc/2", "b")); // rev 4
  store.put(make_put("election/svd/1", "x")); // rev 5

  auto req = make_range("election/svc/", "election/svc0");
  req.set_sort_target(etcdserverpb::RangeRequest::CREATE);
  req.set_sort_order(etcdserverpb::RangeRequest::ASCEND);
  auto resp = store.range(req);
  ASSERT_EQ(resp.kvs_size(), 3);
  EXPECT_EQ(resp.kvs(0).key(), "election/svc/3");
  EXPECT_EQ(resp.kvs(1).key(), "election/svc/1");
  EXPECT_EQ(resp.kvs(2).key(), "election/svc/2");

  req.set_limit(1);
  resp = store.range(req);
  ASSERT_EQ(resp.kvs_size(), 1);
  EXPECT_EQ(resp.kvs(0).key(), "election/svc/3");
  EXPECT_TRUE(resp.more());
  EXPECT_EQ(resp.count(), 3);

  req.set_limit(0);
  req.set_sort_order(etcdserverpb::RangeRequest::DESCEND);
  req.set_max_create_revision(3);
  resp = store.range(req);
  ASSERT_EQ(resp.kvs_size(), 2);
  EXPECT_EQ(resp.kvs(0).key(), "election/svc/1");
  EXPECT_EQ(resp.kvs(1).key(), "election/svc/3");

  req.set_max_create_revision(0);
  req.set_min_create_revision(4);
  req.set_keys_only(true);
  resp = store.range(req);
  ASSERT_EQ(resp.kvs_size(), 1);
  EXPECT_EQ(resp.kvs(0).key(), "election/svc/2");
  EXPECT_EQ(resp.kvs(0).value(), "");

  auto count = make_range("election/", "election0");
  count.set_count_only(true);
  resp = store.range(count);
  EXPECT_EQ(resp.count(), 4);
  EXPECT_EQ(resp.kvs_size(), 0);
}

/**
 * @test Verify that transactions evaluate the comparisons and apply one branch atomically.
 */
TEST(in_memory_store, txn) {
  ballot::testing::in_memory_store store;
  auto lease = store.grant_lease(std::chrono::seconds(10));
  auto key = "election/svc/" + std::to_string(lease->lease_id());

  auto resp = store.txn(make_campaign(key, "A", lease->lease_id()));
  EXPECT_TRUE(resp.succeeded());
  EXPECT_EQ(resp.header().revision(), 2);
  ASSERT_EQ(resp.responses_size(), 1);
  EXPECT_TRUE(resp.responses(0).has_response_put());

  resp = store.txn(make_campaign(key, "B", lease->lease_id()));
  EXPECT_FALSE(resp.succeeded());
  EXPECT_EQ(resp.header().revision(), 2);
  ASSERT_EQ(resp.responses_size(), 1);
  ASSERT_EQ(resp.responses(0).response_range().kvs_size(), 1);
  EXPECT_EQ(resp.responses(0).response_range().kvs(0).value(), "A");
  EXPECT_EQ(resp.responses(0).response_range().kvs(0).create_revision(), 2);
  EXPECT_EQ(resp.responses(0).response_range().kvs(0).lease(), lease->lease_id());

  // ... compare-and-delete on the create revision ...
  etcdserverpb::TxnRequest del;
  auto& cmp = *del.add_compare();
  cmp.set_key(key);
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_result(etcdserverpb::Compare::EQUAL);
  cmp.set_create_revision(7);
  del.add_success()->mutable_request_delete_range()->set_key(key);
  EXPECT_FALSE(store.txn(del).succeeded());
  EXPECT_EQ(store.range(make_range(key)).kvs_size(), 1);

  del.mutable_compare(0)->set_create_revision(2);
  resp = store.txn(del);
  EXPECT_TRUE(resp.succeeded());
  EXPECT_EQ(resp.responses(0).response_delete_range().deleted(), 1);
  EXPECT_EQ(store.range(make_range(key)).kvs_size(), 0);
  EXPECT_EQ(store.revision(), 3);

  // ... a value comparison against a missing key is false ...
  etcdserverpb::TxnRequest value;
  auto& vcmp = *value.add_compare();
  vcmp.set_key(key);
  vcmp.set_target(etcdserverpb::Compare::VALUE);
  vcmp.set_result(etcdserverpb::Compare::NOT_EQUAL);
  vcmp.set_value("A");
  EXPECT_FALSE(store.txn(value).succeeded());

  // ... puts with an unknown lease fail and do not modify the store ...
  EXPECT_THROW(store.txn(make_campaign(key, "C", 42)), ballot::store_error);
  EXPECT_EQ(store.revision(), 3);
}

/**
 * @test Verify that revoking or expiring a lease deletes its keys.
 */
TEST(in_memory_store, leases) {
  ballot::testing::in_memory_store store;
  EXPECT_THROW(store.grant_lease(std::chrono::seconds(0)), ballot::store_error);

  auto l0 = store.grant_lease(std::chrono::seconds(10));
  auto l1 = store.grant_lease(std::chrono::seconds(10));
  EXPECT_NE(l0->lease_id(), l1->lease_id());
  EXPECT_EQ(l0->actual_TTL().count(), 10000);
  EXPECT_EQ(store.active_leases(), 2UL);

  store.put(make_put("a", "0", l0->lease_id()));
  store.put(make_put("b", "1", l1->lease_id()));
  store.put(make_put("c", "1", l1->lease_id()));

  int lost0 = 0;
  int lost1 = 0;
  l0->on_lost([&lost0]() { ++lost0; });
  l1->on_lost([&lost1]() { ++lost1; });

  l0->revoke();
  EXPECT_FALSE(l0->is_active());
  EXPECT_EQ(lost0, 0);
  EXPECT_EQ(store.range(make_range("a")).kvs_size(), 0);

  auto rev = store.revision();
  store.expire_lease(l1->lease_id());
  EXPECT_FALSE(l1->is_active());
  EXPECT_EQ(lost1, 1);
  // ... all the keys are deleted at the same revision ...
  EXPECT_EQ(store.revision(), rev + 1);
  EXPECT_EQ(store.range(make_range("a", "z")).kvs_size(), 0);
  EXPECT_EQ(store.active_leases(), 0UL);

  // ... expiring twice does not notify twice ...
  store.expire_lease(l1->lease_id());
  EXPECT_EQ(lost1, 1);
  // ... revoking a lease that is gone is not an error ...
  EXPECT_NO_THROW(l1->revoke());
}

/**
 * @test Verify that a lost lease keeps its keys until it expires.
 */
TEST(in_memory_store, lose_lease) {
  ballot::testing::in_memory_store store;
  auto l = store.grant_lease(std::chrono::seconds(10));
  store.put(make_put("a", "0", l->lease_id()));
  int lost = 0;
  l->on_lost([&lost]() { ++lost; });

  store.lose_lease(l->lease_id());
  EXPECT_EQ(lost, 1);
  EXPECT_EQ(store.range(make_range("a")).kvs_size(), 1);
  EXPECT_EQ(store.active_leases(), 1UL);

  // ... the lost handler is called at most once ...
  store.expire_lease(l->lease_id());
  EXPECT_EQ(lost, 1);
  EXPECT_EQ(store.range(make_range("a")).kvs_size(), 0);
}

/**
 * @test Verify that a null handler unregisters the lost notification.
 */
TEST(in_memory_store, lease_unregister) {
  ballot::testing::in_memory_store store;
  auto lease = store.grant_lease(std::chrono::seconds(10));
  int lost = 0;
  lease->on_lost([&lost]() { ++lost; });
  lease->on_lost(ballot::lease::lost_handler());
  store.expire_lease(lease->lease_id());
  EXPECT_EQ(lost, 0);

  // ... destroying the lease also closes the notification ...
  auto other = store.grant_lease(std::chrono::seconds(10));
  auto id = other->lease_id();
  other->on_lost([&lost]() { ++lost; });
  other.reset();
  store.expire_lease(id);
  EXPECT_EQ(lost, 0);
}

/**
 * @test Verify that watches deliver the events in order and honor the filters.
 */
TEST(in_memory_store, watch) {
  ballot::testing::in_memory_store store;
  std::vector<std::string> prefix_events;
  std::vector<std::string> delete_events;
  auto w0 = store.watch(
      make_watch("election/svc/", "election/svc0"),
      [&prefix_events](mvccpb::Event const& ev) {
        prefix_events.push_back((ev.type() == mvccpb::Event::PUT ? "PUT " : "DELETE ") + ev.kv().key());
      },
      [](std::exception_ptr) {});
  auto req = make_watch("election/svc/1");
  req.add_filters(etcdserverpb::WatchCreateRequest::NOPUT);
  req.set_prev_kv(true);
  std::string prev_value;
  auto w1 = store.watch(
      req,
      [&delete_events, &prev_value](mvccpb::Event const& ev) {
        delete_events.push_back(ev.kv().key());
        prev_value = ev.prev_kv().value();
      },
      [](std::exception_ptr) {});
  EXPECT_EQ(store.active_watches(), 2UL);

  store.put(make_put("election/svc/1", "A"));
  store.put(make_put("election/svc/2", "B"));
  store.put(make_put("election/other", "C"));
  etcdserverpb::DeleteRangeRequest del;
  del.set_key("election/svc/1");
  store.delete_range(del);

  EXPECT_THAT(
      prefix_events, ::testing::ElementsAre("PUT election/svc/1", "PUT election/svc/2", "DELETE election/svc/1"));
  EXPECT_THAT(delete_events, ::testing::ElementsAre("election/svc/1"));
  EXPECT_EQ(prev_value, "A");

  w0->cancel();
  w0->cancel();
  EXPECT_EQ(store.active_watches(), 1UL);
  store.put(make_put("election/svc/3", "C"));
  EXPECT_EQ(prefix_events.size(), 3UL);
}

/**
 * @test Verify that watches replay the history from the start revision, and fail when it is compacted.
 */
TEST(in_memory_store, watch_history) {
  ballot::testing::in_memory_store store;
  store.put(make_put("foo", "1")); // rev 2
  store.put(make_put("foo", "2")); // rev 3
  etcdserverpb::DeleteRangeRequest del;
  del.set_key("foo");
  store.delete_range(del); // rev 4

  std::vector<std::int64_t> revisions;
  auto req = make_watch("foo");
  req.set_start_revision(3);
  auto w = store.watch(
      req, [&revisions](mvccpb::Event const& ev) { revisions.push_back(ev.kv().mod_revision()); },
      [](std::exception_ptr) {});
  EXPECT_THAT(revisions, ::testing::ElementsAre(3, 4));

  EXPECT_THROW(store.compact(10), ballot::store_error);
  store.compact(4);
  EXPECT_THROW(store.compact(3), ballot::compacted_error);

  std::exception_ptr error;
  int events = 0;
  req.set_start_revision(2);
  auto compacted = store.watch(req, [&events](mvccpb::Event const&) { ++events; }, [&error](std::exception_ptr ex) {
    error = ex;
  });
  ASSERT_TRUE((bool)error);
  try {
    std::rethrow_exception(error);
  } catch (ballot::compacted_error const& ex) {
    EXPECT_EQ(ex.compact_revision(), 4);
  } catch (...) {
    FAIL() << "expected a ballot::compacted_error";
  }
  store.put(make_put("foo", "3"));
  EXPECT_EQ(events, 0);
}

/**
 * @test Verify that the failure injection hooks work.
 */
TEST(in_memory_store, inject_failures) {
  ballot::testing::in_memory_store store;
  store.inject_failures("range", 2);
  EXPECT_THROW(store.range(make_range("foo")), ballot::store_error);
  EXPECT_THROW(store.range(make_range("foo")), ballot::store_error);
  EXPECT_NO_THROW(store.range(make_range("foo")));

  store.inject_failures("grant_lease", 1);
  EXPECT_THROW(store.grant_lease(std::chrono::seconds(5)), ballot::store_error);
  auto lease = store.grant_lease(std::chrono::seconds(5));

  store.inject_failures("revoke", 1);
  EXPECT_THROW(lease->revoke(), ballot::store_error);
  EXPECT_TRUE(lease->is_active());

  std::vector<std::exception_ptr> errors;
  int events = 0;
  auto w = store.watch(make_watch("foo"), [&events](mvccpb::Event const&) { ++events; }, [&errors](std::exception_ptr ex) {
    errors.push_back(ex);
  });
  store.fail_watches();
  EXPECT_EQ(errors.size(), 1UL);
  EXPECT_EQ(store.active_watches(), 0UL);
  store.put(make_put("foo", "bar"));
  EXPECT_EQ(events, 0);
  EXPECT_EQ(errors.size(), 1UL);
}
