#ifndef ballot_detail_leader_observer_hpp
#define ballot_detail_leader_observer_hpp

#include <ballot/detail/exponential_backoff.hpp>
#include <ballot/store.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ballot {
namespace detail {

/**
 * Report the leader of an election to a set of subscribers.
 *
 * A background thread runs the observation loop while there are subscribers.  Each cycle of the loop:
 *   - reads the candidate with the lowest creation revision, or if there are none, watches the election prefix
 *     until the first candidate appears,
 *   - reports that candidate key to the subscribers,
 *   - waits until that key is deleted.
 *
 * The thread starts when the first subscriber registers, and exits when a cycle ends without subscribers.  Errors in a
 * cycle are reported to the subscribers and the cycle restarts after a backoff period, so the stream of notifications
 * continues while the store recovers.  The same leader can be reported more than once.
 */
class leader_observer {
public:
  //@{
  /// @name type traits
  using leader_handler = std::function<void(std::string const&)>;
  using error_handler = std::function<void(std::exception_ptr)>;
  //@}

  /**
   * Create an observer for the candidates under @a prefix.
   *
   * @param s the store holding the election.
   * @param prefix the election prefix, all the candidate keys start with it.
   * @param min_backoff the delay before the first restart after a failed cycle.
   * @param max_backoff the maximum delay between restarts.
   */
  leader_observer(
      std::shared_ptr<store> s, std::string prefix,
      std::chrono::milliseconds min_backoff = std::chrono::milliseconds(100),
      std::chrono::milliseconds max_backoff = std::chrono::milliseconds(10000));

  leader_observer(leader_observer const&) = delete;
  leader_observer& operator=(leader_observer const&) = delete;

  /// Stop the observation thread, implies shutdown().
  ~leader_observer() noexcept(false);

  /**
   * Register a new subscriber, starts the observation thread if needed.
   *
   * If the leader is known the subscriber receives it before this function returns.
   *
   * @returns a token to unsubscribe.
   */
  long subscribe(leader_handler on_leader, error_handler on_error);

  /**
   * Remove a subscriber.
   *
   * The observation thread stops after the current cycle if there are no subscribers left.
   *
   * @throws std::invalid_argument if @a token is not a registered subscriber.
   */
  void unsubscribe(long token);

  /// Deliver an error to all the subscribers.
  void report_error(std::exception_ptr ex);

  /// True while the observation thread is running.
  bool is_observing() const;

  /// The leader reported by the last cycle, empty if the leader is unknown.
  std::string current_leader() const;

  /// Stop the observation thread and wait for it, it must not be called from a subscriber.
  void shutdown();

private:
  /// The body of the observation thread.
  void run();

  /// Run a single cycle, returns false if it failed.
  bool run_cycle();

  /// Find the current leader, waiting for the first candidate if needed.
  std::string find_leader(std::int64_t& revision);

  void notify_leader(std::string const& key);

private:
  std::shared_ptr<store> store_;
  std::string prefix_;
  exponential_backoff backoff_;

  /// Serialize the notifications, so each subscriber sees the leaders in order.
  std::recursive_mutex notify_mu_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::map<long, std::pair<leader_handler, error_handler>> subscriptions_;
  long token_gen_;
  std::string current_leader_;
  bool running_;
  std::atomic<bool> stop_;
  std::thread thread_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_leader_observer_hpp
