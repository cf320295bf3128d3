#include "ballot/detail/leader_observer.hpp"
#include <ballot/detail/scoped_watcher.hpp>
#include <ballot/detail/wait_for_delete.hpp>
#include <ballot/log.hpp>
#include <ballot/prefix_end.hpp>

#include <stdexcept>
#include <vector>

namespace ballot {
namespace detail {
namespace {
/// The first candidate created in an empty election, shared with the watch handlers.
struct first_candidate {
  std::mutex mu;
  std::condition_variable cv;
  std::string key;
  std::int64_t revision = 0;
  std::exception_ptr error;
};
} // anonymous namespace

leader_observer::leader_observer(
    std::shared_ptr<store> s, std::string prefix, std::chrono::milliseconds min_backoff,
    std::chrono::milliseconds max_backoff)
    : store_(std::move(s))
    , prefix_(std::move(prefix))
    , backoff_(min_backoff, max_backoff)
    , notify_mu_()
    , mu_()
    , cv_()
    , subscriptions_()
    , token_gen_(0)
    , current_leader_()
    , running_(false)
    , stop_(false)
    , thread_() {
}

leader_observer::~leader_observer() noexcept(false) {
  shutdown();
}

long leader_observer::subscribe(leader_handler on_leader, error_handler on_error) {
  std::lock_guard<std::recursive_mutex> notify(notify_mu_);
  std::unique_lock<std::mutex> lock(mu_);
  auto token = ++token_gen_;
  subscriptions_.emplace(token, std::make_pair(on_leader, std::move(on_error)));
  if (not running_ and not stop_.load()) {
    // ... a previous thread may have exited after its last cycle, it no longer needs the lock ...
    if (thread_.joinable()) {
      thread_.join();
    }
    running_ = true;
    thread_ = std::thread([this]() { this->run(); });
  }
  auto leader = current_leader_;
  // ... release the lock while calling application code, holding locks in such cases is prone to deadlocking ...
  lock.unlock();
  if (not leader.empty() and on_leader) {
    try {
      on_leader(leader);
    } catch (std::exception const& ex) {
      BALLOT_LOG(error) << "exception raised by leader subscriber for " << prefix_ << ": " << ex.what();
    }
  }
  return token;
}

void leader_observer::unsubscribe(long token) {
  std::lock_guard<std::mutex> lock(mu_);
  if (subscriptions_.erase(token) == 0) {
    throw std::invalid_argument("unknown subscription token " + std::to_string(token));
  }
}

void leader_observer::report_error(std::exception_ptr ex) {
  std::lock_guard<std::recursive_mutex> notify(notify_mu_);
  std::vector<error_handler> handlers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    for (auto const& s : subscriptions_) {
      if (s.second.second) {
        handlers.push_back(s.second.second);
      }
    }
  }
  for (auto const& h : handlers) {
    try {
      h(ex);
    } catch (std::exception const& e) {
      BALLOT_LOG(error) << "exception raised by error subscriber for " << prefix_ << ": " << e.what();
    }
  }
}

bool leader_observer::is_observing() const {
  std::lock_guard<std::mutex> lock(mu_);
  return running_;
}

std::string leader_observer::current_leader() const {
  std::lock_guard<std::mutex> lock(mu_);
  return current_leader_;
}

void leader_observer::shutdown() {
  std::thread t;
  {
    std::lock_guard<std::mutex> lock(mu_);
    stop_.store(true);
    t = std::move(thread_);
  }
  cv_.notify_all();
  if (t.joinable()) {
    t.join();
  }
}

void leader_observer::run() {
  BALLOT_LOG(info) << "observer for " << prefix_ << " started";
  for (;;) {
    bool ok = run_cycle();
    std::unique_lock<std::mutex> lock(mu_);
    if (stop_.load() or subscriptions_.empty()) {
      running_ = false;
      current_leader_.clear();
      BALLOT_LOG(info) << "observer for " << prefix_ << " stopped";
      return;
    }
    if (not ok) {
      auto delay = backoff_.current_delay();
      BALLOT_LOG(warning) << "restarting observer for " << prefix_ << " in " << delay.count() << "ms";
      cv_.wait_for(lock, delay, [this]() { return stop_.load(); });
    }
  }
}

bool leader_observer::run_cycle() {
  try {
    std::int64_t revision = 0;
    auto leader = find_leader(revision);
    if (leader.empty()) {
      return true;
    }
    notify_leader(leader);
    if (wait_for_delete(*store_, leader, revision + 1, &stop_)) {
      BALLOT_LOG(info) << "leader " << leader << " is gone";
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      current_leader_.clear();
    }
    backoff_.record_success();
    return true;
  } catch (std::exception const& ex) {
    auto delay = backoff_.record_failure();
    BALLOT_LOG(warning) << "observer cycle for " << prefix_ << " failed, attempt=" << backoff_.failure_count()
                        << ", delay=" << delay.count() << "ms: " << ex.what();
    report_error(std::current_exception());
  }
  return false;
}

std::string leader_observer::find_leader(std::int64_t& revision) {
  // ... the leader is the candidate with the lowest creation revision ...
  etcdserverpb::RangeRequest req;
  req.set_key(prefix_);
  req.set_range_end(prefix_end(prefix_));
  req.set_sort_order(etcdserverpb::RangeRequest::ASCEND);
  req.set_sort_target(etcdserverpb::RangeRequest::CREATE);
  req.set_limit(1);
  auto resp = store_->range(req);
  if (not resp.kvs().empty()) {
    revision = resp.header().revision();
    return resp.kvs(0).key();
  }

  // ... no candidates, the first key created after the read is the new leader ...
  auto waiter = std::make_shared<first_candidate>();
  etcdserverpb::WatchCreateRequest create;
  create.set_key(prefix_);
  create.set_range_end(prefix_end(prefix_));
  create.set_start_revision(resp.header().revision() + 1);
  create.add_filters(etcdserverpb::WatchCreateRequest::NODELETE);
  scoped_watcher watch(store_->watch(
      create,
      [waiter](mvccpb::Event const& ev) {
        if (ev.type() != mvccpb::Event::PUT) {
          return;
        }
        std::lock_guard<std::mutex> lock(waiter->mu);
        if (waiter->key.empty()) {
          waiter->key = ev.kv().key();
          waiter->revision = ev.kv().mod_revision();
          waiter->cv.notify_all();
        }
      },
      [waiter](std::exception_ptr ex) {
        std::lock_guard<std::mutex> lock(waiter->mu);
        waiter->error = ex;
        waiter->cv.notify_all();
      }));

  std::unique_lock<std::mutex> lock(waiter->mu);
  while (waiter->key.empty() and not waiter->error) {
    if (stop_.load()) {
      return std::string();
    }
    waiter->cv.wait_for(lock, stop_poll_period);
  }
  if (not waiter->key.empty()) {
    revision = waiter->revision;
    return waiter->key;
  }
  auto error = waiter->error;
  // ... release the lock before the watch is cancelled, the error handler takes it ...
  lock.unlock();
  std::rethrow_exception(error);
}

void leader_observer::notify_leader(std::string const& key) {
  std::lock_guard<std::recursive_mutex> notify(notify_mu_);
  std::vector<leader_handler> handlers;
  {
    std::lock_guard<std::mutex> lock(mu_);
    current_leader_ = key;
    for (auto const& s : subscriptions_) {
      if (s.second.first) {
        handlers.push_back(s.second.first);
      }
    }
  }
  BALLOT_LOG(info) << "leader for " << prefix_ << " is " << key;
  for (auto const& h : handlers) {
    try {
      h(key);
    } catch (std::exception const& ex) {
      BALLOT_LOG(error) << "exception raised by leader subscriber for " << prefix_ << ": " << ex.what();
    }
  }
}

} // namespace detail
} // namespace ballot
