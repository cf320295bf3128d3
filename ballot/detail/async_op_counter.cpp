#include "ballot/detail/async_op_counter.hpp"

namespace ballot {
namespace detail {

void async_op_counter::block_until_all_done() {
  std::unique_lock<std::mutex> lock(mu_);
  shutdown_ = true;
  cv_.wait(lock, [this]() { return pending_ == 0; });
}

bool async_op_counter::add_op() {
  std::lock_guard<std::mutex> lock(mu_);
  if (shutdown_) {
    return false;
  }
  ++pending_;
  return true;
}

void async_op_counter::del_op() {
  std::unique_lock<std::mutex> lock(mu_);
  if (--pending_ == 0) {
    lock.unlock();
    cv_.notify_all();
  }
}

} // namespace detail
} // namespace ballot
