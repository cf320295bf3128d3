#include "ballot/active_completion_queue.hpp"
#include <ballot/log.hpp>

namespace ballot {

active_completion_queue::active_completion_queue()
    : queue_(std::make_shared<completion_queue<>>())
    , thread_() {
  auto q = queue_;
  thread_ = std::thread([q]() { q->run(); });
}

active_completion_queue::active_completion_queue(std::shared_ptr<completion_queue<>> q, std::thread&& t)
    : queue_(std::move(q))
    , thread_(std::move(t)) {
}

active_completion_queue::active_completion_queue(active_completion_queue&& rhs) noexcept
    : queue_(std::move(rhs.queue_))
    , thread_(std::move(rhs.thread_)) {
}

active_completion_queue& active_completion_queue::operator=(active_completion_queue&& rhs) noexcept {
  if (this != &rhs) {
    stop();
    queue_ = std::move(rhs.queue_);
    thread_ = std::move(rhs.thread_);
  }
  return *this;
}

active_completion_queue::~active_completion_queue() {
  stop();
}

void active_completion_queue::stop() {
  if (queue_) {
    BALLOT_LOG(trace) << "shutdown active completion queue";
    queue_->shutdown();
  }
  if (thread_.joinable()) {
    BALLOT_LOG(trace) << "join active completion queue";
    thread_.join();
  }
  queue_.reset();
}

} // namespace ballot
