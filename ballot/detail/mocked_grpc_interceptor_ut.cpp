#include "ballot/detail/mocked_grpc_interceptor.hpp"
#include <ballot/completion_queue.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

namespace {
using completion_queue_type = ballot::completion_queue<ballot::detail::mocked_grpc_interceptor>;
using watch_stream_type = ballot::detail::async_rdwr_stream<etcdserverpb::WatchRequest, etcdserverpb::WatchResponse>;
} // anonymous namespace

/**
 * @test Verify that timers are routed to the mock and fire only when the test says so.
 */
TEST(mocked_grpc_interceptor, deadline_timer) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;
  completion_queue_type queue;

  std::vector<std::shared_ptr<deadline_timer>> pending_timer;
  using namespace ::testing;
  auto action = [&pending_timer](auto bop) {
    auto* op = dynamic_cast<deadline_timer*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    // ... keep the timer around, the test decides when it fires ...
    pending_timer.push_back(std::shared_ptr<deadline_timer>(bop, op));
  };
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "test/absolute";
  }))).WillOnce(Invoke(action));
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "test/relative";
  }))).WillOnce(Invoke(action));

  int cnt_ok = 0;
  int cnt_cancelled = 0;
  auto handle_timer = [&cnt_ok, &cnt_cancelled](auto const& op, bool ok) {
    if (ok) {
      ++cnt_ok;
    } else {
      ++cnt_cancelled;
    }
  };
  queue.make_relative_timer(100ms, "test/relative", handle_timer);
  ASSERT_EQ(pending_timer.size(), 1UL);
  EXPECT_EQ(cnt_ok, 0);
  pending_timer[0]->callback(*pending_timer[0], true);
  EXPECT_EQ(cnt_ok, 1);
  EXPECT_EQ(cnt_cancelled, 0);
  pending_timer.pop_back();

  queue.make_deadline_timer(std::chrono::system_clock::now() + 100ms, "test/absolute", handle_timer);
  ASSERT_EQ(pending_timer.size(), 1UL);
  pending_timer[0]->callback(*pending_timer[0], false);
  EXPECT_EQ(cnt_ok, 1);
  EXPECT_EQ(cnt_cancelled, 1);
}

/**
 * @test Verify that a unary RPC blocks the future until the mock completes it.
 */
TEST(mocked_grpc_interceptor, async_rpc_future) {
  using namespace std::chrono_literals;
  // ... a null stub, the mocked interceptor never uses it ...
  std::shared_ptr<etcdserverpb::KV::Stub> kv;
  completion_queue_type queue;

  using namespace ::testing;
  std::shared_ptr<ballot::detail::base_async_op> last_op;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillOnce(Invoke([&last_op](auto op) {
    last_op = op;
  }));

  etcdserverpb::RangeRequest req;
  req.set_key("election/svc/");
  auto fut = queue.async_rpc(kv.get(), &etcdserverpb::KV::Stub::AsyncRange, std::move(req), "test/range",
      ballot::use_future());
  ASSERT_EQ(fut.wait_for(10ms), std::future_status::timeout);

  ASSERT_TRUE((bool)last_op);
  {
    using op_type = ballot::detail::async_rpc_op<etcdserverpb::RangeRequest, etcdserverpb::RangeResponse>;
    auto* op = dynamic_cast<op_type*>(last_op.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.key(), "election/svc/");
    op->response.mutable_header()->set_revision(42);
    op->response.set_count(1);
  }
  last_op->callback(*last_op, true);

  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  auto response = fut.get();
  EXPECT_EQ(response.header().revision(), 42);
  EXPECT_EQ(response.count(), 1);
}

/**
 * @test Verify that cancelled RPCs and RPCs with an error status raise ballot::store_error.
 */
TEST(mocked_grpc_interceptor, async_rpc_errors) {
  using namespace std::chrono_literals;
  std::shared_ptr<etcdserverpb::Lease::Stub> lease;
  completion_queue_type queue;

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "test/grant/cancelled";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "test/grant/unavailable";
  }))).WillOnce(Invoke([](auto bop) {
    using op_type = ballot::detail::async_rpc_op<etcdserverpb::LeaseGrantRequest, etcdserverpb::LeaseGrantResponse>;
    auto* op = dynamic_cast<op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::StatusCode::UNAVAILABLE, "connection refused");
    bop->callback(*bop, true);
  }));

  etcdserverpb::LeaseGrantRequest req;
  req.set_ttl(5);
  auto fut = queue.async_rpc(lease.get(), &etcdserverpb::Lease::Stub::AsyncLeaseGrant, std::move(req),
      "test/grant/cancelled", ballot::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  try {
    fut.get();
    FAIL() << "expected an exception";
  } catch (ballot::store_error const& ex) {
    EXPECT_EQ(ex.code(), grpc::StatusCode::CANCELLED);
  }

  etcdserverpb::LeaseGrantRequest req2;
  req2.set_ttl(5);
  auto fut2 = queue.async_rpc(lease.get(), &etcdserverpb::Lease::Stub::AsyncLeaseGrant, std::move(req2),
      "test/grant/unavailable", ballot::use_future());
  try {
    fut2.get();
    FAIL() << "expected an exception";
  } catch (ballot::store_error const& ex) {
    EXPECT_EQ(ex.code(), grpc::StatusCode::UNAVAILABLE);
    EXPECT_THAT(ex.what(), HasSubstr("connection refused"));
    EXPECT_THAT(ex.what(), HasSubstr("test/grant/unavailable"));
  }
}

/**
 * @test Verify the creation of read-write streams is intercepted.
 */
TEST(mocked_grpc_interceptor, create_rdwr_stream) {
  using namespace std::chrono_literals;
  std::shared_ptr<etcdserverpb::Watch::Stub> watch;
  completion_queue_type queue;

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_))
      .WillOnce(Invoke([](auto op) { op->callback(*op, true); }))
      .WillOnce(Invoke([](auto op) { op->callback(*op, true); }))
      .WillOnce(Invoke([](auto op) { op->callback(*op, false); }));

  int counter = 0;
  queue.async_create_rdwr_stream(watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "test/watch/functor",
      [&counter](auto const& op, bool ok) {
        counter += int(ok);
        EXPECT_TRUE((bool)op.stream);
      });
  EXPECT_EQ(counter, 1);

  auto fut = queue.async_create_rdwr_stream(watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch,
      "test/watch/future", ballot::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  std::shared_ptr<watch_stream_type> stream;
  ASSERT_NO_THROW(stream = fut.get());
  EXPECT_TRUE((bool)stream);

  auto fut2 = queue.async_create_rdwr_stream(watch.get(), &etcdserverpb::Watch::Stub::AsyncWatch,
      "test/watch/cancelled", ballot::use_future());
  ASSERT_EQ(fut2.wait_for(0ms), std::future_status::ready);
  EXPECT_THROW(fut2.get(), ballot::store_error);
}

/**
 * @test Verify Write() and Read() operations on read-write streams are intercepted.
 */
TEST(mocked_grpc_interceptor, rdwr_stream_write_read) {
  using namespace std::chrono_literals;
  completion_queue_type queue;

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillRepeatedly(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::write_op<etcdserverpb::WatchRequest>*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.create_request().key(), "election/svc/leader");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::read_op<etcdserverpb::WatchResponse>*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_created(true);
    op->response.set_watch_id(7);
    bop->callback(*bop, true);
  }));

  watch_stream_type stream;
  int writes = 0;
  etcdserverpb::WatchRequest req;
  req.mutable_create_request()->set_key("election/svc/leader");
  queue.async_write(stream, std::move(req), "test/watch/write", [&writes](auto const& op, bool ok) {
    writes += int(ok);
  });
  EXPECT_EQ(writes, 1);

  etcdserverpb::WatchRequest req2;
  req2.mutable_create_request()->set_key("election/svc/leader");
  auto fut = queue.async_write(stream, std::move(req2), "test/watch/write/future", ballot::use_future());
  ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
  EXPECT_NO_THROW(fut.get());

  std::int64_t watch_id = 0;
  queue.async_read(stream, "test/watch/read", [&watch_id](auto const& op, bool ok) {
    ASSERT_TRUE(ok);
    EXPECT_TRUE(op.response.created());
    watch_id = op.response.watch_id();
  });
  EXPECT_EQ(watch_id, 7);
}

/**
 * @test Verify WritesDone(), Finish() and TryCancel() on read-write streams are intercepted.
 */
TEST(mocked_grpc_interceptor, rdwr_stream_close) {
  using namespace std::chrono_literals;
  completion_queue_type queue;

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_writes_done(_))
      .WillOnce(Invoke([](auto bop) { bop->callback(*bop, true); }))
      .WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::StatusCode::CANCELLED, "cancelled by client");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).Times(1);

  watch_stream_type stream;
  auto done = queue.async_writes_done(stream, "test/watch/writes_done", ballot::use_future());
  ASSERT_EQ(done.wait_for(0ms), std::future_status::ready);
  EXPECT_NO_THROW(done.get());

  auto done2 = queue.async_writes_done(stream, "test/watch/writes_done/cancelled", ballot::use_future());
  EXPECT_THROW(done2.get(), ballot::store_error);

  queue.try_cancel_on(stream);

  auto finish = queue.async_finish(stream, "test/watch/finish", ballot::use_future());
  ASSERT_EQ(finish.wait_for(0ms), std::future_status::ready);
  auto status = finish.get();
  EXPECT_EQ(status.error_code(), grpc::StatusCode::CANCELLED);
}
