#include <ballot/detail/exponential_backoff.hpp>

#include <sstream>

namespace ballot {
namespace detail {
std::chrono::milliseconds exponential_backoff::record_failure() {
  ++failure_count_;
  if (current_delay_ < min_delay_) {
    current_delay_ = min_delay_;
    return current_delay_;
  }
  current_delay_ = 2 * current_delay_;
  if (current_delay_ > max_delay_) {
    current_delay_ = max_delay_;
  }
  return current_delay_;
}

std::chrono::milliseconds exponential_backoff::record_success() {
  failure_count_ = 0;
  current_delay_ = std::chrono::milliseconds(0);
  return current_delay_;
}

std::chrono::milliseconds exponential_backoff::current_delay() const {
  return current_delay_;
}

void exponential_backoff::validate_arguments() {
  if (min_delay_.count() <= 0) {
    std::ostringstream os;
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) should be > 0";
    throw std::invalid_argument(os.str());
  }
  if (min_delay_ > max_delay_) {
    std::ostringstream os;
    os << "exponential_backoff() - min_delay (" << min_delay_.count() << "ms) should be <= max_delay ("
       << max_delay_.count() << "ms)";
    throw std::invalid_argument(os.str());
  }
}

} // namespace detail
} // namespace ballot
