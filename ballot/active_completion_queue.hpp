#ifndef ballot_active_completion_queue_hpp
#define ballot_active_completion_queue_hpp

#include <ballot/completion_queue.hpp>

#include <memory>
#include <thread>

namespace ballot {

/**
 * A completion queue with a thread running its event loop.
 *
 * On destruction it shuts down the completion queue first, and then joins the thread.  Objects that post operations
 * to the queue (leases, watchers, stores) must be destroyed before this object.
 */
class active_completion_queue {
public:
  /// Create a new completion queue and a thread to run its loop.
  active_completion_queue();

  /// Take ownership of an existing queue and the thread running its loop.
  active_completion_queue(std::shared_ptr<completion_queue<>> q, std::thread&& t);

  active_completion_queue(active_completion_queue&& rhs) noexcept;
  active_completion_queue& operator=(active_completion_queue&& rhs) noexcept;
  active_completion_queue(active_completion_queue const&) = delete;
  active_completion_queue& operator=(active_completion_queue const&) = delete;

  ~active_completion_queue();

  /// Return false if the queue was moved-from.
  explicit operator bool() const {
    return static_cast<bool>(queue_);
  }

  completion_queue<>& cq() {
    return *queue_;
  }

private:
  /// Shutdown the queue and join the thread, if any.
  void stop();

private:
  std::shared_ptr<completion_queue<>> queue_;
  std::thread thread_;
};

} // namespace ballot

#endif // ballot_active_completion_queue_hpp
