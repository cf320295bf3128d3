#include "ballot/detail/etcd_store_impl.hpp"
#include <ballot/detail/mocked_grpc_interceptor.hpp>

#include <gmock/gmock.h>

namespace {
using completion_queue_type = ballot::completion_queue<ballot::detail::mocked_grpc_interceptor>;
using store_type = ballot::detail::etcd_store_impl<completion_queue_type>;
using txn_op_type = ballot::detail::async_rpc_op<etcdserverpb::TxnRequest, etcdserverpb::TxnResponse>;
using range_op_type = ballot::detail::async_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse>;

std::unique_ptr<store_type> make_store(completion_queue_type& queue) {
  return std::unique_ptr<store_type>(new store_type(
      queue, std::shared_ptr<etcdserverpb::KV::Stub>(), std::shared_ptr<etcdserverpb::Watch::Stub>(),
      std::shared_ptr<etcdserverpb::Lease::Stub>()));
}
} // anonymous namespace

/**
 * @test Verify that ballot::detail::etcd_store_impl forwards transactions and returns the response.
 */
TEST(etcd_store_impl, txn) {
  completion_queue_type queue;
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "store/txn";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<txn_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    ASSERT_EQ(op->request.compare_size(), 1);
    EXPECT_EQ(op->request.compare(0).key(), "election/svc/1000");
    EXPECT_EQ(op->request.compare(0).target(), etcdserverpb::Compare::CREATE);
    EXPECT_EQ(op->request.compare(0).create_revision(), 0);
    ASSERT_EQ(op->request.success_size(), 1);
    EXPECT_EQ(op->request.success(0).request_put().value(), "A");
    op->response.set_succeeded(true);
    op->response.mutable_header()->set_revision(7);
    bop->callback(*bop, true);
  }));

  auto store = make_store(queue);
  etcdserverpb::TxnRequest req;
  auto& cmp = *req.add_compare();
  cmp.set_key("election/svc/1000");
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_result(etcdserverpb::Compare::EQUAL);
  cmp.set_create_revision(0);
  auto& put = *req.add_success()->mutable_request_put();
  put.set_key("election/svc/1000");
  put.set_value("A");
  put.set_lease(1000);

  auto resp = store->txn(req);
  EXPECT_TRUE(resp.succeeded());
  EXPECT_EQ(resp.header().revision(), 7);
  // ... the request is not modified ...
  EXPECT_EQ(req.compare_size(), 1);
}

/**
 * @test Verify that ballot::detail::etcd_store_impl forwards the other KV operations.
 */
TEST(etcd_store_impl, kv_operations) {
  completion_queue_type queue;
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "store/range";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<range_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.sort_target(), etcdserverpb::RangeRequest::CREATE);
    op->response.mutable_header()->set_revision(9);
    op->response.add_kvs()->set_key("election/svc/1000");
    op->response.set_count(1);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "store/put";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, true); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "store/delete_range";
  }))).WillOnce(Invoke([](auto bop) {
    using op_type =
        ballot::detail::async_rpc_op<etcdserverpb::DeleteRangeRequest, etcdserverpb::DeleteRangeResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_deleted(1);
    bop->callback(*bop, true);
  }));

  auto store = make_store(queue);
  etcdserverpb::RangeRequest range;
  range.set_key("election/svc/");
  range.set_range_end("election/svc0");
  range.set_sort_target(etcdserverpb::RangeRequest::CREATE);
  auto r = store->range(range);
  EXPECT_EQ(r.header().revision(), 9);
  ASSERT_EQ(r.kvs_size(), 1);
  EXPECT_EQ(r.kvs(0).key(), "election/svc/1000");

  etcdserverpb::PutRequest put;
  put.set_key("foo");
  EXPECT_NO_THROW(store->put(put));

  etcdserverpb::DeleteRangeRequest del;
  del.set_key("foo");
  EXPECT_EQ(store->delete_range(del).deleted(), 1);
}

/**
 * @test Verify that gRPC errors are raised as ballot::store_error.
 */
TEST(etcd_store_impl, errors) {
  completion_queue_type queue;
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_))
      .WillOnce(Invoke([](auto bop) {
        auto* op = dynamic_cast<range_op_type*>(bop.get());
        ASSERT_TRUE(op != nullptr);
        op->status = grpc::Status(grpc::StatusCode::UNAVAILABLE, "etcd is down");
        bop->callback(*bop, true);
      }))
      .WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));

  auto store = make_store(queue);
  etcdserverpb::RangeRequest req;
  req.set_key("foo");
  try {
    store->range(req);
    FAIL() << "expected an exception";
  } catch (ballot::store_error const& ex) {
    EXPECT_EQ(ex.code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_THAT(ex.what(), HasSubstr("store/range"));
  }
  EXPECT_THROW(store->range(req), ballot::store_error);
}

/**
 * @test Verify that ballot::detail::etcd_store_impl creates leases and watchers on the same queue.
 */
TEST(etcd_store_impl, leases_and_watchers) {
  completion_queue_type queue;
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "lease/grant";
  }))).WillOnce(Invoke([](auto bop) {
    using op_type = ballot::detail::async_rpc_op<etcdserverpb::LeaseGrantRequest, etcdserverpb::LeaseGrantResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.ttl(), 10);
    op->response.set_id(2000);
    op->response.set_ttl(10);
    bop->callback(*bop, true);
  }));
  // ... the timers are cancelled immediately, these tests do not need keep alives ...
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, false);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  std::shared_ptr<ballot::detail::base_async_op> pending_read;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillRepeatedly(Invoke([&pending_read](auto op) {
    pending_read = op;
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillRepeatedly(Invoke([&pending_read]() {
    if (pending_read) {
      auto p = std::move(pending_read);
      p->callback(*p, false);
    }
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));

  auto store = make_store(queue);
  auto lease = store->grant_lease(std::chrono::seconds(10));
  ASSERT_TRUE((bool)lease);
  EXPECT_EQ(lease->lease_id(), 2000);
  EXPECT_EQ(lease->actual_TTL().count(), 10000);

  etcdserverpb::WatchCreateRequest req;
  req.set_key("election/svc/2000");
  auto watcher = store->watch(req, [](mvccpb::Event const&) {}, [](std::exception_ptr) {});
  ASSERT_TRUE((bool)watcher);
  EXPECT_TRUE((bool)pending_read);
  EXPECT_NO_THROW(watcher->cancel());
  EXPECT_FALSE((bool)pending_read);

  EXPECT_NO_THROW(watcher.reset());
  EXPECT_NO_THROW(lease.reset());
}
