#ifndef ballot_detail_deadline_timer_hpp
#define ballot_detail_deadline_timer_hpp

#include <ballot/detail/base_async_op.hpp>

#include <grpc++/alarm.h>

#include <chrono>
#include <memory>

namespace ballot {
namespace detail {
/**
 * A deadline timer, implemented with a grpc::Alarm.
 */
struct deadline_timer : public base_async_op {
  /**
   * Cancel the timer.
   *
   * The callback is still invoked, with ok == false, from the thread running the completion queue.  Resources are
   * only released in that thread.
   */
  void cancel() {
    if (alarm_) {
      alarm_->Cancel();
    }
  }

  std::chrono::system_clock::time_point deadline;

private:
  friend struct default_grpc_interceptor;
  std::unique_ptr<grpc::Alarm> alarm_;
};
} // namespace detail
} // namespace ballot

#endif // ballot_detail_deadline_timer_hpp
