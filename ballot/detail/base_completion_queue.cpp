#include "ballot/detail/base_completion_queue.hpp"
#include <ballot/assert_throw.hpp>
#include <ballot/log.hpp>

#include <sstream>

namespace ballot {
namespace detail {

std::chrono::milliseconds constexpr base_completion_queue::loop_timeout;

base_completion_queue::base_completion_queue()
    : mu_()
    , pending_ops_()
    , queue_()
    , shutdown_(false) {
}

base_completion_queue::~base_completion_queue() {
  std::lock_guard<std::mutex> lock(mu_);
  if (pending_ops_.empty()) {
    return;
  }
  // ... calling the pending operations is not safe, they may point to objects already deleted, the best we can do is
  // to report them ...
  std::ostringstream os;
  for (auto const& op : pending_ops_) {
    os << op.second->name << "\n";
  }
  BALLOT_LOG(error) << "completion queue deleted while holding " << pending_ops_.size()
                    << " pending operations: " << os.str();
}

void base_completion_queue::run() {
  void* tag = nullptr;
  bool ok = false;
  while (not shutdown_.load()) {
    auto deadline = std::chrono::system_clock::now() + loop_timeout;

    auto status = queue_.AsyncNext(&tag, &ok, deadline);
    if (status == grpc::CompletionQueue::SHUTDOWN) {
      BALLOT_LOG(trace) << "shutdown, exit loop";
      break;
    }
    if (status == grpc::CompletionQueue::TIMEOUT) {
      continue;
    }
    if (tag == nullptr) {
      BALLOT_LOG(warning) << "null tag reported in asynchronous operation";
      continue;
    }

    std::shared_ptr<base_async_op> op = unregister_op(tag);
    if (not op) {
      BALLOT_LOG(error) << "unknown tag reported in asynchronous operation: " << std::hex << std::intptr_t(tag);
      continue;
    }
    // ... the operation is no longer in the table and the lock is released, call it ...
    op->callback(*op, ok);
  }
}

void base_completion_queue::shutdown() {
  BALLOT_LOG(trace) << "shutting down queue";
  shutdown_.store(true);
  queue_.Shutdown();
}

std::size_t base_completion_queue::pending_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return pending_ops_.size();
}

void* base_completion_queue::register_op(char const* where, std::shared_ptr<base_async_op> op) {
  void* tag = static_cast<void*>(op.get());
  auto key = reinterpret_cast<std::intptr_t>(tag);
  BALLOT_LOG(trace) << where << " registering " << op->name;
  std::lock_guard<std::mutex> lock(mu_);
  auto r = pending_ops_.emplace(key, std::move(op));
  BALLOT_ASSERT_THROW(r.second);
  return tag;
}

std::shared_ptr<base_async_op> base_completion_queue::unregister_op(void* tag) {
  std::lock_guard<std::mutex> lock(mu_);
  auto i = pending_ops_.find(reinterpret_cast<std::intptr_t>(tag));
  if (i == pending_ops_.end()) {
    return std::shared_ptr<base_async_op>();
  }
  auto op = std::move(i->second);
  pending_ops_.erase(i);
  return op;
}

} // namespace detail
} // namespace ballot
