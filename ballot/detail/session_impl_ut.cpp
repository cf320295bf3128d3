#include "ballot/detail/session_impl.hpp"
#include <ballot/detail/mocked_grpc_interceptor.hpp>

/// Define helper types and functions used in these tests
namespace {
using completion_queue_type = ballot::completion_queue<ballot::detail::mocked_grpc_interceptor>;
using session_type = ballot::detail::session_impl<completion_queue_type>;
using grant_op_type =
    ballot::detail::async_rpc_op<etcdserverpb::LeaseGrantRequest, etcdserverpb::LeaseGrantResponse>;
using revoke_op_type =
    ballot::detail::async_rpc_op<etcdserverpb::LeaseRevokeRequest, etcdserverpb::LeaseRevokeResponse>;
using ka_read_op_type = ballot::detail::read_op<etcdserverpb::LeaseKeepAliveResponse>;
using ka_write_op_type = ballot::detail::write_op<etcdserverpb::LeaseKeepAliveRequest>;

/// Common initialization for all tests
void prepare_mocks_common(completion_queue_type& queue);

/// Expect a LeaseGrant request and return lease 1000 with a 42s TTL.
void expect_lease_grant(completion_queue_type& queue);

/// Capture the keep alive timers, and cancel them when the stream is cancelled.
void capture_timers(completion_queue_type& queue, std::shared_ptr<ballot::detail::deadline_timer>& pending_timer);

/// Fire the pending timer, if any.
void fire(std::shared_ptr<ballot::detail::deadline_timer>& pending_timer, bool ok) {
  if (not pending_timer) {
    return;
  }
  auto p = std::move(pending_timer);
  p->callback(*p, ok);
}
} // anonymous namespace

/**
 * @test Verify that ballot::detail::session_impl works in the simple case.
 */
TEST(session_impl, basic) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue);
  std::shared_ptr<deadline_timer> pending_timer;
  capture_timers(queue, pending_timer);

  auto session = std::make_unique<session_type>(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  EXPECT_EQ(session->lease_id(), 1000);
  EXPECT_EQ(session->actual_TTL().count(), 42000);
  EXPECT_TRUE(session->is_active());
  EXPECT_EQ(session->current_state(), session_state::waiting_for_timer);
  ASSERT_TRUE((bool)pending_timer);
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that ballot::detail::session_impl reports leases rejected by the server.
 */
TEST(session_impl, lease_error) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "lease/grant";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<grant_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.ttl(), 5);
    op->response.set_error("something broke");
    bop->callback(*bop, true);
  }));
  // ... there should be no calls to setup the timer.
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_)).Times(0);

  std::unique_ptr<session_type> session;
  EXPECT_THROW(
      session = std::make_unique<session_type>(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms),
      ballot::store_error);
}

/**
 * @test Verify that ballot::detail::session_impl reports gRPC errors while obtaining the lease.
 */
TEST(session_impl, lease_grant_unavailable) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "lease/grant";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<grant_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->status = grpc::Status(grpc::StatusCode::UNAVAILABLE, "no etcd here");
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_)).Times(0);

  try {
    session_type session(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
    FAIL() << "expected an exception";
  } catch (ballot::store_error const& ex) {
    EXPECT_EQ(ex.code(), grpc::StatusCode::UNAVAILABLE);
  }
}

/**
 * @test Verify that ballot::detail::session_impl works when the keep alive stream cannot be created.
 */
TEST(session_impl, stream_error) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(Truly([](auto op) {
    return op->name == "lease/ka_stream";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).Times(0);

  std::unique_ptr<session_type> session;
  EXPECT_THROW(
      session = std::make_unique<session_type>(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms),
      ballot::store_error);
}

/**
 * @test Verify a full lifecycle (create, get lease, some keep alive, revoke).
 */
TEST(session_impl, full_lifecycle) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue);
  std::shared_ptr<deadline_timer> pending_timer;
  capture_timers(queue, pending_timer);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(Truly([](auto op) {
    return op->name == "lease/keep_alive/write";
  }))).Times(2).WillRepeatedly(Invoke([](auto bop) {
    auto* op = dynamic_cast<ka_write_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.id(), 1000);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "lease/keep_alive/read";
  }))).Times(2).WillRepeatedly(Invoke([](auto bop) {
    auto* op = dynamic_cast<ka_read_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_id(1000);
    op->response.set_ttl(24);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "lease/revoke";
  }))).WillOnce(Invoke([&pending_timer](auto bop) {
    auto* op = dynamic_cast<revoke_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.id(), 1000);
    // ... the real timer would be cancelled by now ...
    fire(pending_timer, false);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_writes_done(_)).Times(1).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).Times(1).WillOnce(Invoke([](auto bop) {
    bop->callback(*bop, true);
  }));

  bool lost = false;
  auto session = std::make_unique<session_type>(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  session->on_lost([&lost]() { lost = true; });
  EXPECT_EQ(session->actual_TTL().count(), 42000);
  ASSERT_TRUE(session->is_active());

  // ... a complete timer -> write -> read cycle updates the TTL and sets a new timer ...
  fire(pending_timer, true);
  EXPECT_EQ(session->actual_TTL().count(), 24000);
  ASSERT_TRUE((bool)pending_timer);
  fire(pending_timer, true);
  EXPECT_EQ(session->actual_TTL().count(), 24000);
  ASSERT_TRUE((bool)pending_timer);
  ASSERT_TRUE(session->is_active());

  // ... okay, after two cycles let's revoke the lease ...
  EXPECT_NO_THROW(session->revoke());
  EXPECT_FALSE(session->is_active());
  EXPECT_EQ(session->current_state(), session_state::revoked);
  // ... revoking twice is a no-op ...
  EXPECT_NO_THROW(session->revoke());

  EXPECT_NO_THROW(session.reset(nullptr));
  EXPECT_FALSE(lost);
}

/**
 * @test Verify that a broken keep alive stream is reported as a lost lease, exactly once.
 */
TEST(session_impl, lost_on_broken_stream) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue);
  std::shared_ptr<deadline_timer> pending_timer;
  capture_timers(queue, pending_timer);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "lease/keep_alive/read";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));

  int lost_count = 0;
  auto session = std::make_unique<session_type>(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  session->on_lost([&lost_count]() { ++lost_count; });

  fire(pending_timer, true);
  EXPECT_EQ(lost_count, 1);
  EXPECT_FALSE(session->is_active());
  EXPECT_EQ(session->current_state(), session_state::lost);
  // ... no more keep alive cycles after the lease is lost ...
  EXPECT_FALSE((bool)pending_timer);

  EXPECT_NO_THROW(session.reset(nullptr));
  EXPECT_EQ(lost_count, 1);
}

/**
 * @test Verify that a keep alive response with TTL <= 0 is reported as a lost lease.
 */
TEST(session_impl, lost_on_expired) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue);
  std::shared_ptr<deadline_timer> pending_timer;
  capture_timers(queue, pending_timer);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(Truly([](auto op) {
    return op->name == "lease/keep_alive/read";
  }))).WillOnce(Invoke([](auto bop) {
    auto* op = dynamic_cast<ka_read_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_id(1000);
    op->response.set_ttl(0);
    bop->callback(*bop, true);
  }));

  int lost_count = 0;
  session_type session(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  session.on_lost([&lost_count]() { ++lost_count; });
  fire(pending_timer, true);
  EXPECT_EQ(lost_count, 1);
  EXPECT_FALSE(session.is_active());
}

/**
 * @test Verify that a null handler unregisters the lost notification.
 */
TEST(session_impl, on_lost_unregister) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue);
  std::shared_ptr<deadline_timer> pending_timer;
  capture_timers(queue, pending_timer);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(Truly([](auto op) {
    return op->name == "lease/keep_alive/write";
  }))).WillOnce(Invoke([](auto bop) { bop->callback(*bop, false); }));

  int lost_count = 0;
  session_type session(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  session.on_lost([&lost_count]() { ++lost_count; });
  session.on_lost(session_type::lost_handler());
  fire(pending_timer, true);
  EXPECT_EQ(lost_count, 0);
  EXPECT_EQ(session.current_state(), session_state::lost);
}

/**
 * @test Verify that ballot::detail::session_impl handles races between revoke() and the timer.
 */
TEST(session_impl, race_timer) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue);
  std::shared_ptr<deadline_timer> pending_timer;
  capture_timers(queue, pending_timer);

  auto session = std::make_unique<session_type>(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
  ASSERT_TRUE(session->is_active());
  ASSERT_TRUE((bool)pending_timer);

  using namespace ::testing;
  // ... no keep alive requests once the lease is being revoked ...
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).Times(0);
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "lease/revoke";
  }))).WillOnce(Invoke([&pending_timer, &session](auto bop) {
    EXPECT_FALSE(session->is_active());
    // ... fire the timer, which should not start a new keep alive cycle ...
    fire(pending_timer, true);
    EXPECT_FALSE((bool)pending_timer);
    bop->callback(*bop, true);
  }));

  EXPECT_NO_THROW(session->revoke());
  EXPECT_FALSE(session->is_active());
  EXPECT_NO_THROW(session.reset(nullptr));
}

/**
 * @test Verify that revoking an expired lease is not an error, and other revoke errors are reported.
 */
TEST(session_impl, revoke_errors) {
  using namespace std::chrono_literals;
  using namespace ballot::detail;

  completion_queue_type queue;
  prepare_mocks_common(queue);
  expect_lease_grant(queue);
  std::shared_ptr<deadline_timer> pending_timer;
  capture_timers(queue, pending_timer);

  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "lease/revoke";
  })))
      .WillOnce(Invoke([&pending_timer](auto bop) {
        fire(pending_timer, false);
        auto* op = dynamic_cast<revoke_op_type*>(bop.get());
        ASSERT_TRUE(op != nullptr);
        op->status = grpc::Status(grpc::StatusCode::NOT_FOUND, "etcdserver: requested lease not found");
        bop->callback(*bop, true);
      }))
      .WillOnce(Invoke([&pending_timer](auto bop) {
        fire(pending_timer, false);
        auto* op = dynamic_cast<revoke_op_type*>(bop.get());
        ASSERT_TRUE(op != nullptr);
        op->status = grpc::Status(grpc::StatusCode::UNAVAILABLE, "connection reset");
        bop->callback(*bop, true);
      }));

  {
    session_type session(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
    EXPECT_NO_THROW(session.revoke());
    EXPECT_EQ(session.current_state(), session_state::revoked);
  }
  {
    session_type session(queue, std::shared_ptr<etcdserverpb::Lease::Stub>(), 5000ms);
    EXPECT_THROW(session.revoke(), ballot::store_error);
    EXPECT_FALSE(session.is_active());
  }
}

namespace {
void prepare_mocks_common(completion_queue_type& queue) {
  using namespace ::testing;
  // ... on most calls we just invoke the application's callback immediately ...
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_read(_)).WillRepeatedly(Invoke([](auto bop) {
    auto* op = dynamic_cast<ka_read_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    op->response.set_id(1000);
    op->response.set_ttl(42);
    bop->callback(*bop, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_write(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_create_rdwr_stream(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_writes_done(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, async_finish(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, true);
  }));
  // ... timers fire as cancelled, otherwise the keep alive cycle would never stop ...
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(_)).WillRepeatedly(Invoke([](auto op) {
    op->callback(*op, false);
  }));
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillRepeatedly(Return());
}

void expect_lease_grant(completion_queue_type& queue) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, async_rpc(Truly([](auto op) {
    return op->name == "lease/grant";
  }))).WillRepeatedly(Invoke([](auto bop) {
    auto* op = dynamic_cast<grant_op_type*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    EXPECT_EQ(op->request.ttl(), 5);
    EXPECT_EQ(op->request.id(), 0);
    op->response.set_error("");
    op->response.set_id(1000);
    op->response.set_ttl(42);
    bop->callback(*bop, true);
  }));
}

void capture_timers(completion_queue_type& queue, std::shared_ptr<ballot::detail::deadline_timer>& pending_timer) {
  using namespace ::testing;
  EXPECT_CALL(*queue.interceptor().shared_mock, make_deadline_timer(Truly([](auto op) {
    return op->name == "lease/keep_alive/timer";
  }))).WillRepeatedly(Invoke([&pending_timer](auto bop) {
    auto* op = dynamic_cast<ballot::detail::deadline_timer*>(bop.get());
    ASSERT_TRUE(op != nullptr);
    // ... the standard trick to downcast shared_ptr<> ...
    pending_timer = std::shared_ptr<ballot::detail::deadline_timer>(bop, op);
  }));
  // ... cancelling the stream also cancels the timer, the mocked timers ignore deadline_timer::cancel() ...
  EXPECT_CALL(*queue.interceptor().shared_mock, try_cancel()).WillRepeatedly(Invoke([&pending_timer]() {
    fire(pending_timer, false);
  }));
}
} // anonymous namespace
