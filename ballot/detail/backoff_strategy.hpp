#ifndef ballot_detail_backoff_strategy_hpp
#define ballot_detail_backoff_strategy_hpp

#include <chrono>

namespace ballot {
namespace detail {
/**
 * Define the interface for a backoff strategy.
 *
 * The leader observer restarts its loop after each failure, this interface paces those restarts so a persistently
 * failing store is not hammered with requests.  The most common implementation is a simple exponential backoff,
 * where the time between attempts doubles after a failure, up to some limit.
 */
class backoff_strategy {
public:
  virtual ~backoff_strategy() = default;

  /// Report a failure to the backoff strategy, returns the delay before the next attempt.
  virtual std::chrono::milliseconds record_failure() = 0;
  /// Report a success to the backoff strategy, returns the delay before the next attempt.
  virtual std::chrono::milliseconds record_success() = 0;
  /// Returns the current delay in the backoff strategy.
  virtual std::chrono::milliseconds current_delay() const = 0;
};
} // namespace detail
} // namespace ballot

#endif // ballot_detail_backoff_strategy_hpp
