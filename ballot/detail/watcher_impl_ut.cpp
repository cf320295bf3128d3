#include "ballot/detail/watcher_impl.hpp"
#include <ballot/detail/mocked_grpc_interceptor.hpp>

#include <gmock/gmock.h>

#include <vector>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = ballot::completion_queue<ballot::detail::mocked_grpc_interceptor>;
using watcher_type = ballot::detail::watcher_impl<completion_queue_type>;
using read_op_type = ballot::detail::read_op<etcdserverpb::WatchResponse>;
using write_op_type = ballot::detail::write_op<etcdserverpb::WatchRequest>;

/// Common initialization for all tests
void prepare_mocks_common(completion_queue_type& queue);

/// Capture the pending reads, the tests deliver the responses.
void capture_reads(completion_queue_type& queue, std::shared_ptr<read_op_type>& pending_read);

/// Deliver a response to the pending read.
void deliver(std::shared_ptr<read_op_type>& pending_read, etcdserverpb::WatchResponse const& r) {
  ASSERT_TRUE((bool)pending_read);
  auto p = std::move(pending_read);
  p->response = r;
  p->callback(*p, true);
}

etcdserverpb::WatchCreateRequest make_create(std::string const& key, std::int64_t start_revision) {
  etcdserverpb::WatchCreateRequest req;
  req.set_key(key);
  req.set_start_revision(start_revision);
  req.add_filters(etcdserverpb::WatchCreateRequest::NOPUT);
  return req;
}

etcdserverpb::WatchResponse delete_event(std::string const& key, std::int64_t revision) {
  etcdserverpb::WatchResponse r;
  r.set_watch_id(3);
  r.mutable_header()->set_revision(revision);
  auto& ev = *r.add_events();
  ev.set_type(mvccpb::Event::DELETE);
  ev.mutable_kv()->set_key(key);
  ev.mutable_kv()->set_mod_revision(revision);
  return r;
}
} // anonymous namespace

/**
 * @test Verify that ballot::detail::watcher_impl sends the create request and delivers the events.
 */
TEST(watcher_impl, basic) {
  completion_queue_type queue;
  prepare_mocks_common(queue);
  std::shared_ptr<read_op_type> pending_read;
  capture_reads(queue, pending_read);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(Truly([](auto op) {
    return op->name == "watch/create";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<write_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    ASSERT_TRUE(op->request.has_create_request());
    EXPECT_EQ(op->request.create_request().key(), "election/svc/1000");
    EXPECT_EQ(op->request.create_request().start_revision(), 42);
    ASSERT_EQ(op->request.create_request().filters_size(), 1);
    EXPECT_EQ(op->request.create_request().filters(0), etcdserverpb::WatchCreateRequest::NOPUT);
    bop->callback(*bop, true);
  }));

  std::vector<std::string> events;
  int errors = 0;
  watcher_type watcher(
      queue, std::shared_ptr<etcdserverpb::Watch::Stub>(), make_create("election/svc/1000", 42),
      [&events](mvccpb::Event const& ev) { events.push_back(ev.kv().key()); },
      [&errors](std::exception_ptr) { ++errors; });
  ASSERT_TRUE((bool)pending_read);
  EXPECT_EQ(watcher.watch_id(), -1);

  etcdserverpb::WatchResponse created;
  created.set_created(true);
  created.set_watch_id(3);
  deliver(pending_read, created);
  EXPECT_EQ(watcher.watch_id(), 3);
  EXPECT_TRUE(events.empty());

  deliver(pending_read, delete_event("election/svc/1000", 43));
  ASSERT_EQ(events.size(), 1UL);
  EXPECT_EQ(events[0], "election/svc/1000");
  ASSERT_TRUE((bool)pending_read);

  EXPECT_NO_THROW(watcher.cancel());
  EXPECT_FALSE((bool)pending_read);
  EXPECT_EQ(errors, 0);
  // ... cancel() is idempotent ...
  EXPECT_NO_THROW(watcher.cancel());
}

/**
 * @test Verify that compaction is reported as a ballot::compacted_error.
 */
TEST(watcher_impl, compacted) {
  completion_queue_type queue;
  prepare_mocks_common(queue);
  std::shared_ptr<read_op_type> pending_read;
  capture_reads(queue, pending_read);

  int events = 0;
  std::vector<std::exception_ptr> errors;
  watcher_type watcher(
      queue, std::shared_ptr<etcdserverpb::Watch::Stub>(), make_create("election/svc/1000", 2),
      [&events](mvccpb::Event const&) { ++events; }, [&errors](std::exception_ptr ex) { errors.push_back(ex); });

  etcdserverpb::WatchResponse r;
  r.set_created(true);
  r.set_canceled(true);
  r.set_compact_revision(10);
  deliver(pending_read, r);
  // ... no more reads after an error ...
  EXPECT_FALSE((bool)pending_read);
  ASSERT_EQ(errors.size(), 1UL);
  try {
    std::rethrow_exception(errors[0]);
  } catch (ballot::compacted_error const& ex) {
    EXPECT_EQ(ex.compact_revision(), 10);
  } catch (...) {
    FAIL() << "expected a ballot::compacted_error";
  }
  EXPECT_EQ(events, 0);
}

/**
 * @test Verify that server cancellations and broken streams are reported once.
 */
TEST(watcher_impl, stream_errors) {
  completion_queue_type queue;
  prepare_mocks_common(queue);
  std::shared_ptr<read_op_type> pending_read;
  capture_reads(queue, pending_read);

  std::vector<std::exception_ptr> errors;
  {
    watcher_type watcher(
        queue, std::shared_ptr<etcdserverpb::Watch::Stub>(), make_create("election/svc/1000", 2),
        [](mvccpb::Event const&) {}, [&errors](std::exception_ptr ex) { errors.push_back(ex); });
    etcdserverpb::WatchResponse r;
    r.set_canceled(true);
    r.set_cancel_reason("permission denied");
    deliver(pending_read, r);
  }
  ASSERT_EQ(errors.size(), 1UL);
  EXPECT_THROW(std::rethrow_exception(errors[0]), ballot::store_error);

  errors.clear();
  {
    watcher_type watcher(
        queue, std::shared_ptr<etcdserverpb::Watch::Stub>(), make_create("election/svc/1000", 2),
        [](mvccpb::Event const&) {}, [&errors](std::exception_ptr ex) { errors.push_back(ex); });
    ASSERT_TRUE((bool)pending_read);
    auto p = std::move(pending_read);
    p->callback(*p, false);
    EXPECT_FALSE((bool)pending_read);
  }
  ASSERT_EQ(errors.size(), 1UL);
  try {
    std::rethrow_exception(errors[0]);
  } catch (ballot::store_error const& ex) {
    EXPECT_EQ(ex.code(), grpc::StatusCode::UNAVAILABLE);
  }
}

/**
 * @test Verify that no handlers are called after cancel().
 */
TEST(watcher_impl, no_events_after_cancel) {
  completion_queue_type queue;
  prepare_mocks_common(queue);
  std::shared_ptr<read_op_type> pending_read;
  capture_reads(queue, pending_read);

  int events = 0;
  int errors = 0;
  watcher_type watcher(
      queue, std::shared_ptr<etcdserverpb::Watch::Stub>(), make_create("election/svc/", 2),
      [&events](mvccpb::Event const&) { ++events; }, [&errors](std::exception_ptr) { ++errors; });

  using namespace ::testing;
  // ... this time the cancelled read races with a response ...
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillOnce(Invoke([&pending_read]() {
    auto p = std::move(pending_read);
    p->response = delete_event("election/svc/1000", 43);
    p->callback(*p, true);
  }));
  watcher.cancel();
  EXPECT_EQ(events, 0);
  EXPECT_EQ(errors, 0);
}

/**
 * @test Verify that errors creating the stream are raised by the constructor.
 */
TEST(watcher_impl, create_error) {
  completion_queue_type queue;
  prepare_mocks_common(queue);
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).Times(0);

  std::unique_ptr<watcher_type> watcher;
  EXPECT_THROW(
      watcher.reset(new watcher_type(
          queue, std::shared_ptr<etcdserverpb::Watch::Stub>(), make_create("election/svc/", 2),
          [](mvccpb::Event const&) {}, [](std::exception_ptr) {})),
      ballot::store_error);

  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, false);
  }));
  EXPECT_THROW(
      watcher.reset(new watcher_type(
          queue, std::shared_ptr<etcdserverpb::Watch::Stub>(), make_create("election/svc/", 2),
          [](mvccpb::Event const&) {}, [](std::exception_ptr) {})),
      ballot::store_error);
}

namespace {
void prepare_mocks_common(completion_queue_type& queue) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).WillRepeatedly(Invoke([](auto bop) {
    auto* op = dynamic_cast<ballot::detail::finish_op*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::StatusCode::CANCELLED, "cancelled");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillRepeatedly(Return());
}

void capture_reads(completion_queue_type& queue, std::shared_ptr<read_op_type>& pending_read) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "watch/read";
  }))).WillRepeatedly(Invoke([&pending_read](auto bop) {
    auto* op = dynamic_cast<read_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    pending_read = std::shared_ptr<read_op_type>(bop, op);
  }));
  // ... cancelling the stream completes the pending read ...
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillRepeatedly(Invoke([&pending_read]() {
    if (not pending_read) {
      return;
    }
    auto p = std::move(pending_read);
    p->callback(*p, false);
  }));
}
} // anonymous namespace
