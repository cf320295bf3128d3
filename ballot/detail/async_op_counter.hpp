#ifndef ballot_detail_async_op_counter_hpp
#define ballot_detail_async_op_counter_hpp

#include <ballot/detail/append_annotations.hpp>
#include <ballot/log.hpp>

#include <condition_variable>
#include <mutex>
#include <utility>

namespace ballot {
namespace detail {

/**
 * Track pending asynchronous operations.
 *
 * Leases and watchers post operations whose callbacks reference the object that started them.  Before such an
 * object is destroyed it must stop posting new operations and block until the pending ones complete.
 */
class async_op_counter {
public:
  async_op_counter()
      : mu_()
      , cv_()
      , pending_(0)
      , shutdown_(false) {
  }

  /**
   * Stop accepting new operations and block until all pending operations complete.
   *
   * Do not call this from the thread running the completion queue event loop.
   */
  void block_until_all_done();

  /// Stop accepting new operations, async_op_start() returns false afterwards.
  void shutdown() {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
  }

  bool in_shutdown() const {
    std::lock_guard<std::mutex> lock(mu_);
    return shutdown_;
  }

  /// The number of pending operations.
  int pending() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pending_;
  }

  /**
   * Increment the count of pending asynchronous operations.
   *
   * Call this just before the asynchronous operation starts, otherwise the operation may complete before the count
   * is incremented.
   *
   * @param a annotations included in the trace log.
   * @return true if the operation should be started, false if the counter is shutdown.
   */
  template <typename... Annotations>
  bool async_op_start(Annotations&&... a) {
    BALLOT_LOGGER_DECL(trace, ballot::log::instance(), logger);
    if (logger) {
      append_annotations(logger.get(), "async_op_start(): ", pending(), " ", std::forward<Annotations>(a)...);
      logger.write_to(ballot::log::instance());
    }
    return add_op();
  }

  /**
   * Decrement the count of pending asynchronous operations.
   *
   * Call this when the asynchronous operation completes, successfully or not.
   *
   * @param a annotations included in the trace log.
   */
  template <typename... Annotations>
  void async_op_done(Annotations&&... a) {
    BALLOT_LOGGER_DECL(trace, ballot::log::instance(), logger);
    if (logger) {
      append_annotations(logger.get(), "async_op_done(): ", pending(), " ", std::forward<Annotations>(a)...);
      logger.write_to(ballot::log::instance());
    }
    del_op();
  }

private:
  bool add_op();
  void del_op();

private:
  mutable std::mutex mu_;
  std::condition_variable cv_;
  int pending_;
  bool shutdown_;
};

/**
 * Count an operation as pending for the lifetime of this object.
 *
 * Used around operations that block with ballot::use_future.
 */
class async_op_tracer {
public:
  async_op_tracer(async_op_counter& counter, char const* name)
      : counter_(counter)
      , name_(name)
      , started_(counter_.async_op_start(name_)) {
  }
  ~async_op_tracer() {
    if (started_) {
      counter_.async_op_done(name_);
    }
  }

  /// Return false if the counter was already shutdown.
  explicit operator bool() const {
    return started_;
  }

  async_op_tracer(async_op_tracer&&) = delete;
  async_op_tracer& operator=(async_op_tracer&&) = delete;
  async_op_tracer(async_op_tracer const&) = delete;
  async_op_tracer& operator=(async_op_tracer const&) = delete;

private:
  async_op_counter& counter_;
  char const* name_;
  bool started_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_async_op_counter_hpp
