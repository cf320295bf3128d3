#include "ballot/detail/wait_for_delete.hpp"
#include <ballot/detail/scoped_watcher.hpp>
#include <ballot/errors.hpp>
#include <ballot/log.hpp>

#include <condition_variable>
#include <mutex>

namespace ballot {
namespace detail {
namespace {
/// The result of a single watch, shared with the watch handlers.
struct delete_waiter {
  std::mutex mu;
  std::condition_variable cv;
  bool deleted = false;
  std::exception_ptr error;
};

/// Read @a key without its value.
etcdserverpb::RangeResponse read_key(store& s, std::string const& key) {
  etcdserverpb::RangeRequest req;
  req.set_key(key);
  req.set_keys_only(true);
  return s.range(req);
}

/// Return true if @a resp holds the instance of the key created before @a start_revision.
bool same_instance(etcdserverpb::RangeResponse const& resp, std::int64_t start_revision) {
  return not resp.kvs().empty() and resp.kvs(0).create_revision() < start_revision;
}
} // anonymous namespace

bool wait_for_delete(store& s, std::string const& key, std::int64_t start_revision, std::atomic<bool> const* stop) {
  std::int64_t const created_before = start_revision;
  for (;;) {
    auto waiter = std::make_shared<delete_waiter>();
    etcdserverpb::WatchCreateRequest req;
    req.set_key(key);
    req.set_start_revision(start_revision);
    req.add_filters(etcdserverpb::WatchCreateRequest::NOPUT);

    {
      scoped_watcher watch(s.watch(
          req,
          [waiter](mvccpb::Event const& ev) {
            if (ev.type() != mvccpb::Event::DELETE) {
              return;
            }
            std::lock_guard<std::mutex> lock(waiter->mu);
            waiter->deleted = true;
            waiter->cv.notify_all();
          },
          [waiter](std::exception_ptr ex) {
            std::lock_guard<std::mutex> lock(waiter->mu);
            waiter->error = ex;
            waiter->cv.notify_all();
          }));
      BALLOT_LOG(trace) << "waiting for delete of " << key << " from revision " << start_revision;

      // ... the lock must be released before the watch is cancelled, the handlers take it ...
      std::unique_lock<std::mutex> lock(waiter->mu);
      while (not waiter->deleted and not waiter->error) {
        if (stop != nullptr and stop->load()) {
          return false;
        }
        waiter->cv.wait_for(lock, stop_poll_period);
      }
      if (waiter->deleted) {
        BALLOT_LOG(trace) << "key " << key << " deleted";
        return true;
      }
    }

    try {
      std::rethrow_exception(waiter->error);
    } catch (compacted_error const& ex) {
      BALLOT_LOG(info) << "watch on " << key << " compacted at " << ex.compact_revision() << ", reading again";
    }
    auto resp = read_key(s, key);
    if (not same_instance(resp, created_before)) {
      return true;
    }
    start_revision = resp.header().revision() + 1;
  }
}

bool wait_for_deletes(
    store& s, std::vector<std::string> const& keys, std::int64_t start_revision, std::atomic<bool> const* stop) {
  for (auto const& key : keys) {
    if (stop != nullptr and stop->load()) {
      return false;
    }
    if (not same_instance(read_key(s, key), start_revision)) {
      BALLOT_LOG(trace) << "key " << key << " already deleted";
      continue;
    }
    if (not wait_for_delete(s, key, start_revision, stop)) {
      return false;
    }
  }
  return true;
}

} // namespace detail
} // namespace ballot
