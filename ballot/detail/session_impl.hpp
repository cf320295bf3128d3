#ifndef ballot_detail_session_impl_hpp
#define ballot_detail_session_impl_hpp

#include <ballot/completion_queue.hpp>
#include <ballot/detail/async_op_counter.hpp>
#include <ballot/detail/grpc_errors.hpp>
#include <ballot/detail/session_state_machine.hpp>
#include <ballot/errors.hpp>
#include <ballot/lease.hpp>
#include <ballot/log.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <chrono>
#include <mutex>
#include <sstream>

namespace ballot {
namespace detail {

/**
 * Implement ballot::lease over the etcd Lease service.
 *
 * The constructor blocks until the lease is granted, then a keep alive cycle runs on the completion queue: a timer
 * expires every actual_TTL() / keep_alives_per_ttl, a LeaseKeepAlive request is written, the response is read, and a
 * new timer starts.  If the stream breaks, or the server reports the lease as expired, the lease is lost.
 *
 * @tparam completion_queue_type the completion queue, the tests use a mocked queue.
 */
template <typename completion_queue_type>
class session_impl : public ::ballot::lease {
public:
  //@{
  /// @name type traits

  /// The type of the bi-directional RPC stream for keep alive messages
  using ka_stream_type = async_rdwr_stream<etcdserverpb::LeaseKeepAliveRequest, etcdserverpb::LeaseKeepAliveResponse>;

  /// The preferred units for measuring time in this class
  using duration_type = std::chrono::milliseconds;
  //@}

  /// How many KeepAlive requests we send per TTL cycle.
  static int constexpr keep_alives_per_ttl = 5;

  /// Constructor, blocks until the lease is granted.
  template <typename other_duration_type>
  session_impl(
      completion_queue_type& queue, std::shared_ptr<etcdserverpb::Lease::Stub> lease_stub,
      other_duration_type desired_TTL)
      : queue_(queue)
      , lease_client_(std::move(lease_stub))
      , ka_stream_()
      , state_()
      , lease_id_(0)
      , desired_TTL_(convert_duration(desired_TTL))
      , mu_()
      , actual_TTL_(convert_duration(desired_TTL))
      , current_timer_()
      , handler_mu_()
      , lost_handler_()
      , ops_()
      , keep_alive_ops_() {
    preamble();
  }

  session_impl(session_impl const&) = delete;
  session_impl& operator=(session_impl const&) = delete;
  session_impl(session_impl&&) = delete;
  session_impl& operator=(session_impl&&) = delete;

  ~session_impl() noexcept(false) override {
    shutdown();
  }

  std::int64_t lease_id() const override {
    return lease_id_;
  }

  std::chrono::milliseconds actual_TTL() const override {
    std::lock_guard<std::mutex> lock(mu_);
    return actual_TTL_;
  }

  bool is_active() const override {
    switch (state_.current()) {
    case session_state::lease_obtained:
    case session_state::waiting_for_timer:
    case session_state::waiting_for_keep_alive_write:
    case session_state::waiting_for_keep_alive_read:
      return true;
    default:
      return false;
    }
  }

  /// The current state, mostly for testing and debugging.
  session_state current_state() const {
    return state_.current();
  }

  /// Convert a duration to the preferred units in this class
  template <typename other_duration_type>
  static duration_type convert_duration(other_duration_type d) {
    return std::chrono::duration_cast<duration_type>(d);
  }

  void on_lost(lost_handler handler) override {
    std::lock_guard<std::mutex> lock(handler_mu_);
    lost_handler_ = std::move(handler);
  }

  /// Revoke the lease
  void revoke() override {
    if (not state_.change_state("session::revoke()", session_state::revoking)) {
      return;
    }
    cancel_timer();

    // ... here we just block, we could make this asynchronous, but really there is no reason to ...
    {
      etcdserverpb::LeaseRevokeRequest req;
      req.set_id(lease_id_);
      async_op_tracer lease_revoke_trace(ops_, "lease/revoke");
      auto fut = queue_.async_rpc(
          lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseRevoke, std::move(req), "lease/revoke",
          ballot::use_future());
      try {
        fut.get();
      } catch (store_error const& ex) {
        if (ex.code() != grpc::StatusCode::NOT_FOUND) {
          throw;
        }
        // ... the lease already expired, the keys bound to it are gone, that is what the caller wanted ...
        BALLOT_LOG(info) << "revoke lease_id=" << lease_id_ << " already expired: " << ex.what();
      }
    }
    // ... the pending keep alive operations complete on their own, the server answers every request ...
    keep_alive_ops_.block_until_all_done();
    close_stream();
    state_.change_state("session::revoke()", session_state::revoked);
  }

private:
  /// Creates the keep alive stream and requests the lease.
  void preamble() try {
    // ... we want to block until the keep alive streaming RPC is setup, this is (unfortunately) an asynchronous
    // operation, so we have to do some magic ...
    state_.change_state("session::preamble()", session_state::connecting);
    {
      async_op_tracer create_rdwr_stream_trace(ops_, "lease/ka_stream");
      auto fut = queue_.async_create_rdwr_stream(
          lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseKeepAlive, "lease/ka_stream",
          ballot::use_future());
      ka_stream_ = fut.get();
    }
    state_.change_state("session::preamble()", session_state::connected);

    // ... request a new lease from the etcd server, the TTL is in seconds ...
    state_.change_state("session::preamble()", session_state::obtaining_lease);
    etcdserverpb::LeaseGrantRequest req;
    auto ttl_seconds = std::chrono::duration_cast<std::chrono::seconds>(desired_TTL_);
    req.set_ttl(ttl_seconds.count());
    req.set_id(0);

    etcdserverpb::LeaseGrantResponse resp;
    {
      async_op_tracer lease_grant_trace(ops_, "lease/grant");
      auto fut = queue_.async_rpc(
          lease_client_.get(), &etcdserverpb::Lease::Stub::AsyncLeaseGrant, std::move(req), "lease/grant",
          ballot::use_future());
      resp = fut.get();
    }
    if (not resp.error().empty()) {
      std::ostringstream os;
      os << "lease grant request rejected, response=" << print_to_stream(resp);
      throw store_error(os.str());
    }

    lease_id_ = resp.id();
    {
      std::lock_guard<std::mutex> lock(mu_);
      actual_TTL_ = convert_duration(std::chrono::seconds(resp.ttl()));
    }
    state_.change_state("session::preamble()", session_state::lease_obtained);
    BALLOT_LOG(info) << "lease granted lease_id=" << lease_id_ << ", ttl=" << resp.ttl() << "s";

    set_timer();
  } catch (std::exception const& ex) {
    BALLOT_LOG(info) << "lease setup failed: " << ex.what();
    shutdown();
    throw;
  }

  /// Shutdown the local resources.
  void shutdown() {
    if (not state_.change_state("session::shutdown()", session_state::shutting_down)) {
      // ... already shutdown once, nothing to do ...
      return;
    }
    cancel_timer();
    if (ka_stream_) {
      queue_.try_cancel_on(*ka_stream_);
    }
    keep_alive_ops_.block_until_all_done();
    ops_.block_until_all_done();
    state_.change_state("session::shutdown()", session_state::shutdown);
  }

  /// Close the keep alive stream, once there are no pending operations on it.
  void close_stream() {
    if (not ka_stream_) {
      return;
    }
    try {
      async_op_tracer writes_done_trace(ops_, "lease/writes_done");
      queue_.async_writes_done(*ka_stream_, "lease/writes_done", ballot::use_future()).get();

      async_op_tracer finish_trace(ops_, "lease/finish");
      auto status = queue_.async_finish(*ka_stream_, "lease/finish", ballot::use_future()).get();
      check_grpc_status(status, "session::close_stream()", " lease_id=", lease_id_);
    } catch (store_error const& ex) {
      // ... the lease is revoked already, a problem closing the stream only affects local resources ...
      BALLOT_LOG(info) << "error closing keep alive stream for lease_id=" << lease_id_ << ": " << ex.what();
    }
  }

  void cancel_timer() {
    std::shared_ptr<deadline_timer> timer;
    {
      std::lock_guard<std::mutex> lock(mu_);
      timer = std::move(current_timer_);
    }
    if (timer) {
      timer->cancel();
    }
  }

  /// Set a timer to start the next Write/Read cycle.
  void set_timer() {
    // ... only one Write() may be pending on the stream, so the next timer starts after the previous response ...
    if (not state_.change_state("session::set_timer()", session_state::waiting_for_timer)) {
      return;
    }
    if (not keep_alive_ops_.async_op_start("lease/keep_alive/timer")) {
      return;
    }
    auto deadline = std::chrono::system_clock::now() + (actual_TTL() / keep_alives_per_ttl);
    auto timer = queue_.make_deadline_timer(
        deadline, "lease/keep_alive/timer", [this](auto const& op, bool ok) { this->on_timeout(op, ok); });
    {
      std::lock_guard<std::mutex> lock(mu_);
      current_timer_ = timer;
    }
    // ... revoke() or shutdown() may have started while the timer was created ...
    auto s = state_.current();
    if (s == session_state::revoking or s == session_state::shutting_down) {
      timer->cancel();
    }
  }

  /// Handle the timer expiration, Write() a new LeaseKeepAlive request.
  void on_timeout(detail::deadline_timer const&, bool ok) {
    keep_alive_ops_.async_op_done("lease/keep_alive/timer");
    if (not ok) {
      // ... this is a cancelled timer ...
      return;
    }
    if (not state_.change_state("session::on_timeout()", session_state::waiting_for_keep_alive_write)) {
      return;
    }
    if (not keep_alive_ops_.async_op_start("lease/keep_alive/write")) {
      return;
    }
    etcdserverpb::LeaseKeepAliveRequest req;
    req.set_id(lease_id_);
    queue_.async_write(*ka_stream_, std::move(req), "lease/keep_alive/write", [this](auto const& wop, bool wok) {
      this->on_write(wop, wok);
    });
  }

  /// Handle the Write() completion, schedule a new LeaseKeepAlive Read().
  void on_write(typename ka_stream_type::write_op const&, bool ok) {
    keep_alive_ops_.async_op_done("lease/keep_alive/write");
    if (not ok) {
      lost("keep alive write failed");
      return;
    }
    if (not state_.change_state("session::on_write()", session_state::waiting_for_keep_alive_read)) {
      return;
    }
    if (not keep_alive_ops_.async_op_start("lease/keep_alive/read")) {
      return;
    }
    queue_.async_read(
        *ka_stream_, "lease/keep_alive/read", [this](auto const& rop, bool rok) { this->on_read(rop, rok); });
  }

  /// Handle the Read() completion, schedule a new Timer().
  void on_read(typename ka_stream_type::read_op const& op, bool ok) {
    keep_alive_ops_.async_op_done("lease/keep_alive/read");
    if (not ok) {
      lost("keep alive read failed");
      return;
    }
    if (op.response.ttl() <= 0) {
      lost("lease expired on the server");
      return;
    }
    // ... the KeepAliveResponse may have a new TTL value, that is the etcd server may be telling us to backoff ...
    {
      std::lock_guard<std::mutex> lock(mu_);
      actual_TTL_ = convert_duration(std::chrono::seconds(op.response.ttl()));
    }
    set_timer();
  }

  /// Report the lease as lost, unless it is being revoked or shutdown.
  void lost(char const* reason) {
    if (not state_.change_state("session::lost()", session_state::lost)) {
      return;
    }
    BALLOT_LOG(warning) << "lease lost lease_id=" << lease_id_ << ": " << reason;
    std::lock_guard<std::mutex> lock(handler_mu_);
    if (lost_handler_) {
      lost_handler_();
    }
  }

private:
  completion_queue_type& queue_;

  std::shared_ptr<etcdserverpb::Lease::Stub> lease_client_;
  std::shared_ptr<ka_stream_type> ka_stream_;

  session_state_machine state_;

  /// The lease is assigned by etcd during the constructor
  std::int64_t lease_id_;

  /// The requested TTL value.
  duration_type desired_TTL_;

  /// Protect the TTL and timer, they are updated from the completion queue thread.
  mutable std::mutex mu_;

  /// etcd may tell us to use a longer (or shorter?) TTL.
  duration_type actual_TTL_;

  /// The current timer, can be null when waiting for a KeepAlive response.
  std::shared_ptr<detail::deadline_timer> current_timer_;

  /// Held while the lost handler runs, so on_lost() can wait for it.
  std::mutex handler_mu_;
  lost_handler lost_handler_;

  /// Track pending asynchronous operations.
  async_op_counter ops_;
  async_op_counter keep_alive_ops_;
};

/// Define the object.
template <typename completion_queue_type>
int constexpr session_impl<completion_queue_type>::keep_alives_per_ttl;

} // namespace detail
} // namespace ballot

#endif // ballot_detail_session_impl_hpp
