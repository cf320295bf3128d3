#ifndef ballot_detail_exponential_backoff_hpp
#define ballot_detail_exponential_backoff_hpp

#include <ballot/detail/backoff_strategy.hpp>

#include <stdexcept>

namespace ballot {
namespace detail {
/**
 * Double the delay after each failure, starting at @a min_delay and never exceeding @a max_delay.
 *
 * The first failure after a success waits for @a min_delay.  There is no limit on the number of attempts, the
 * leader observer retries for as long as it has subscribers.
 */
class exponential_backoff : public backoff_strategy {
public:
  template <typename min_duration_type, typename max_duration_type>
  exponential_backoff(min_duration_type min_delay, max_duration_type max_delay)
      : min_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(min_delay))
      , max_delay_(std::chrono::duration_cast<std::chrono::milliseconds>(max_delay))
      , current_delay_(std::chrono::milliseconds(0))
      , failure_count_(0) {
    validate_arguments();
  }

  std::chrono::milliseconds record_failure() override;
  std::chrono::milliseconds record_success() override;
  std::chrono::milliseconds current_delay() const override;

  /// The number of consecutive failures.
  int failure_count() const {
    return failure_count_;
  }

private:
  void validate_arguments();

private:
  std::chrono::milliseconds min_delay_;
  std::chrono::milliseconds max_delay_;
  std::chrono::milliseconds current_delay_;
  int failure_count_;
};
} // namespace detail
} // namespace ballot

#endif // ballot_detail_exponential_backoff_hpp
