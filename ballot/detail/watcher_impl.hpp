#ifndef ballot_detail_watcher_impl_hpp
#define ballot_detail_watcher_impl_hpp

#include <ballot/completion_queue.hpp>
#include <ballot/detail/async_op_counter.hpp>
#include <ballot/detail/grpc_errors.hpp>
#include <ballot/errors.hpp>
#include <ballot/log.hpp>
#include <ballot/store.hpp>
#include <ballot/watcher.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <atomic>
#include <sstream>

namespace ballot {
namespace detail {

/**
 * Implement ballot::watcher over the etcd Watch service.
 *
 * Each watcher uses its own Watch stream.  The constructor blocks until the stream is created and the create request
 * is sent, then a Read() loop on the completion queue delivers the events to the application.  The loop stops on the
 * first error, or when the watcher is cancelled.
 *
 * @tparam completion_queue_type the completion queue, the tests use a mocked queue.
 */
template <typename completion_queue_type>
class watcher_impl : public ::ballot::watcher {
public:
  //@{
  /// @name type traits
  using watch_stream_type = async_rdwr_stream<etcdserverpb::WatchRequest, etcdserverpb::WatchResponse>;
  //@}

  watcher_impl(
      completion_queue_type& queue, std::shared_ptr<etcdserverpb::Watch::Stub> watch_stub,
      etcdserverpb::WatchCreateRequest const& create, store::event_handler on_event, store::error_handler on_error)
      : queue_(queue)
      , watch_client_(std::move(watch_stub))
      , stream_()
      , key_(create.key())
      , on_event_(std::move(on_event))
      , on_error_(std::move(on_error))
      , watch_id_(-1)
      , cancelled_(false)
      , failed_(false)
      , ops_()
      , reads_() {
    preamble(create);
  }

  watcher_impl(watcher_impl const&) = delete;
  watcher_impl& operator=(watcher_impl const&) = delete;
  watcher_impl(watcher_impl&&) = delete;
  watcher_impl& operator=(watcher_impl&&) = delete;

  ~watcher_impl() noexcept(false) override {
    cancel();
  }

  /// The watch id assigned by the server, -1 until the server confirms the watch.
  std::int64_t watch_id() const {
    return watch_id_.load();
  }

  void cancel() override {
    if (cancelled_.exchange(true)) {
      return;
    }
    if (stream_) {
      queue_.try_cancel_on(*stream_);
    }
    reads_.block_until_all_done();
    if (stream_) {
      try {
        async_op_tracer finish_trace(ops_, "watch/finish");
        auto status = queue_.async_finish(*stream_, "watch/finish", ballot::use_future()).get();
        BALLOT_LOG(trace) << "watch on " << key_ << " finished with status=" << status.error_code();
      } catch (store_error const& ex) {
        // ... the watch is already cancelled, a problem finishing the stream only affects local resources ...
        BALLOT_LOG(info) << "error finishing watch stream on " << key_ << ": " << ex.what();
      }
    }
    ops_.block_until_all_done();
  }

private:
  /// Create the stream, send the create request, and start reading.
  void preamble(etcdserverpb::WatchCreateRequest const& create) try {
    {
      async_op_tracer create_trace(ops_, "watch/stream");
      stream_ = queue_
                    .async_create_rdwr_stream(
                        watch_client_.get(), &etcdserverpb::Watch::Stub::AsyncWatch, "watch/stream",
                        ballot::use_future())
                    .get();
    }

    etcdserverpb::WatchRequest req;
    *req.mutable_create_request() = create;
    {
      async_op_tracer write_trace(ops_, "watch/create");
      queue_.async_write(*stream_, std::move(req), "watch/create", ballot::use_future()).get();
    }
    BALLOT_LOG(trace) << "watch on " << key_ << " created, start_revision=" << create.start_revision();
    start_read();
  } catch (std::exception const&) {
    cancel();
    throw;
  }

  void start_read() {
    if (cancelled_.load() or not reads_.async_op_start("watch/read")) {
      return;
    }
    queue_.async_read(*stream_, "watch/read", [this](auto const& op, bool ok) { this->on_read(op, ok); });
  }

  void on_read(typename watch_stream_type::read_op const& op, bool ok) {
    // ... the counter must be decremented after the handlers run, cancel() waits on it ...
    struct read_done {
      ~read_done() {
        reads.async_op_done("watch/read");
      }
      async_op_counter& reads;
    } done{reads_};

    if (cancelled_.load()) {
      return;
    }
    if (not ok) {
      std::ostringstream os;
      os << "watch stream on " << key_ << " closed unexpectedly";
      report_error(std::make_exception_ptr(store_error(os.str(), grpc::StatusCode::UNAVAILABLE)));
      return;
    }
    auto const& r = op.response;
    if (r.created()) {
      watch_id_.store(r.watch_id());
    }
    if (r.compact_revision() > 0) {
      std::ostringstream os;
      os << "watch on " << key_ << " cannot start, required revision compacted";
      report_error(std::make_exception_ptr(compacted_error(os.str(), r.compact_revision())));
      return;
    }
    if (r.canceled()) {
      std::ostringstream os;
      os << "watch on " << key_ << " cancelled by server: " << r.cancel_reason();
      report_error(std::make_exception_ptr(store_error(os.str(), grpc::StatusCode::CANCELLED)));
      return;
    }
    for (auto const& ev : r.events()) {
      if (cancelled_.load()) {
        return;
      }
      try {
        on_event_(ev);
      } catch (std::exception const& ex) {
        BALLOT_LOG(error) << "exception raised by watch event handler on " << key_ << ": " << ex.what();
      }
    }
    start_read();
  }

  /// Report an error, at most once, and stop the read loop.
  void report_error(std::exception_ptr ex) {
    if (failed_.exchange(true)) {
      return;
    }
    if (not on_error_) {
      return;
    }
    try {
      on_error_(ex);
    } catch (std::exception const& e) {
      BALLOT_LOG(error) << "exception raised by watch error handler on " << key_ << ": " << e.what();
    }
  }

private:
  completion_queue_type& queue_;
  std::shared_ptr<etcdserverpb::Watch::Stub> watch_client_;
  std::shared_ptr<watch_stream_type> stream_;
  std::string key_;

  store::event_handler on_event_;
  store::error_handler on_error_;

  std::atomic<std::int64_t> watch_id_;
  std::atomic<bool> cancelled_;
  std::atomic<bool> failed_;

  /// Track pending asynchronous operations.
  async_op_counter ops_;
  async_op_counter reads_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_watcher_impl_hpp
