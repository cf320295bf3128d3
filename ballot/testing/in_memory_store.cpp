#include "ballot/testing/in_memory_store.hpp"
#include <ballot/errors.hpp>
#include <ballot/log.hpp>

#include <algorithm>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <vector>

namespace ballot {
namespace testing {
namespace {
/// The lost handler of a lease, shared by the lease object and the store.
struct lost_slot {
  std::mutex mu;
  lease::lost_handler handler;
  bool closed = false;

  /// Call the handler, at most once.
  void fire() {
    std::lock_guard<std::mutex> lock(mu);
    if (closed) {
      return;
    }
    closed = true;
    if (handler) {
      handler();
    }
  }

  /// No more calls to the handler once this returns.
  void close() {
    std::lock_guard<std::mutex> lock(mu);
    closed = true;
    handler = nullptr;
  }
};

struct lease_record {
  std::chrono::seconds ttl;
  std::set<std::string> keys;
  std::shared_ptr<lost_slot> slot;
};

struct watch_record {
  std::string key;
  std::string range_end;
  bool no_put = false;
  bool no_delete = false;
  bool prev_kv = false;
  store::event_handler on_event;
  store::error_handler on_error;
  /// Guarded by the dispatch mutex.
  bool closed = false;
};

/// An event or an error waiting to be delivered to a watch.
struct pending_delivery {
  std::shared_ptr<watch_record> watch;
  mvccpb::Event event;
  std::exception_ptr error;
};

bool in_range(std::string const& key, std::string const& begin, std::string const& end) {
  if (end.empty()) {
    return key == begin;
  }
  if (end == std::string(1, '\0')) {
    return key >= begin;
  }
  return begin <= key and key < end;
}

template <typename T>
bool compare_values(T const& lhs, T const& rhs, etcdserverpb::Compare::CompareResult result) {
  switch (result) {
  case etcdserverpb::Compare::EQUAL:
    return lhs == rhs;
  case etcdserverpb::Compare::GREATER:
    return lhs > rhs;
  case etcdserverpb::Compare::LESS:
    return lhs < rhs;
  case etcdserverpb::Compare::NOT_EQUAL:
    return lhs != rhs;
  default:
    break;
  }
  std::ostringstream os;
  os << "unknown compare result " << result;
  throw store_error(os.str(), grpc::StatusCode::INVALID_ARGUMENT);
}

bool compare_kv(etcdserverpb::Compare const& cmp, mvccpb::KeyValue const& kv) {
  switch (cmp.target()) {
  case etcdserverpb::Compare::VERSION:
    return compare_values(kv.version(), cmp.version(), cmp.result());
  case etcdserverpb::Compare::CREATE:
    return compare_values(kv.create_revision(), cmp.create_revision(), cmp.result());
  case etcdserverpb::Compare::MOD:
    return compare_values(kv.mod_revision(), cmp.mod_revision(), cmp.result());
  case etcdserverpb::Compare::VALUE:
    return compare_values(kv.value(), cmp.value(), cmp.result());
  case etcdserverpb::Compare::LEASE:
    return compare_values(kv.lease(), cmp.lease(), cmp.result());
  default:
    break;
  }
  std::ostringstream os;
  os << "unknown compare target " << cmp.target();
  throw store_error(os.str(), grpc::StatusCode::INVALID_ARGUMENT);
}

std::int64_t sort_value(mvccpb::KeyValue const& kv, etcdserverpb::RangeRequest::SortTarget target) {
  switch (target) {
  case etcdserverpb::RangeRequest::VERSION:
    return kv.version();
  case etcdserverpb::RangeRequest::CREATE:
    return kv.create_revision();
  case etcdserverpb::RangeRequest::MOD:
    return kv.mod_revision();
  default:
    break;
  }
  return 0;
}
} // anonymous namespace

/**
 * The shared state of the store.
 *
 * Leases and watchers keep a reference to it, so they can outlive the in_memory_store object.
 */
struct in_memory_store::state {
  mutable std::mutex mu;
  std::int64_t revision = 1;
  std::int64_t compact_revision = 0;
  std::int64_t next_lease_id = 7587000;
  std::map<std::string, mvccpb::KeyValue> kvs;
  std::vector<mvccpb::Event> history;
  std::map<std::int64_t, lease_record> leases;
  std::set<std::shared_ptr<watch_record>> watches;
  std::map<std::string, int> failures;
  std::deque<pending_delivery> pending;

  /// Held while delivering events, cancel() takes it to wait for a running handler.
  std::recursive_mutex dispatch_mu;

  class lease_impl;
  class watcher_impl;

  /// Raise an injected failure, requires mu to be held.
  void check_failure(char const* operation) {
    auto i = failures.find(operation);
    if (i == failures.end() or i->second <= 0) {
      return;
    }
    --i->second;
    throw store_error(std::string("injected failure in ") + operation, grpc::StatusCode::UNAVAILABLE);
  }

  /// Record an event in the history and queue it for the matching watches, requires mu to be held.
  void publish(mvccpb::Event const& ev) {
    history.push_back(ev);
    for (auto const& w : watches) {
      enqueue(w, ev);
    }
  }

  void enqueue(std::shared_ptr<watch_record> const& w, mvccpb::Event const& ev) {
    if (not in_range(ev.kv().key(), w->key, w->range_end)) {
      return;
    }
    if (ev.type() == mvccpb::Event::PUT and w->no_put) {
      return;
    }
    if (ev.type() == mvccpb::Event::DELETE and w->no_delete) {
      return;
    }
    pending_delivery d{w, ev, nullptr};
    if (not w->prev_kv) {
      d.event.clear_prev_kv();
    }
    pending.push_back(std::move(d));
  }

  /// Deliver the queued events in order, call without holding mu.
  void drain() {
    std::lock_guard<std::recursive_mutex> dispatch(dispatch_mu);
    for (;;) {
      pending_delivery d;
      {
        std::lock_guard<std::mutex> lock(mu);
        if (pending.empty()) {
          return;
        }
        d = std::move(pending.front());
        pending.pop_front();
      }
      if (d.watch->closed) {
        continue;
      }
      try {
        if (d.error) {
          d.watch->closed = true;
          if (d.watch->on_error) {
            d.watch->on_error(d.error);
          }
          continue;
        }
        if (d.watch->on_event) {
          d.watch->on_event(d.event);
        }
      } catch (std::exception const& ex) {
        BALLOT_LOG(error) << "exception raised by watch handler on " << d.watch->key << ": " << ex.what();
      }
    }
  }

  /// Put a key, requires mu to be held.
  mvccpb::KeyValue put(etcdserverpb::PutRequest const& req, std::int64_t rev) {
    if (req.key().empty()) {
      throw store_error("key is not provided", grpc::StatusCode::INVALID_ARGUMENT);
    }
    if (req.lease() != 0 and leases.find(req.lease()) == leases.end()) {
      throw store_error("etcdserver: requested lease not found", grpc::StatusCode::NOT_FOUND);
    }
    mvccpb::KeyValue prev;
    mvccpb::KeyValue kv;
    auto i = kvs.find(req.key());
    if (i == kvs.end()) {
      kv.set_key(req.key());
      kv.set_create_revision(rev);
      kv.set_version(1);
    } else {
      prev = i->second;
      kv = i->second;
      kv.set_version(kv.version() + 1);
      unbind(prev);
    }
    kv.set_mod_revision(rev);
    kv.set_value(req.value());
    kv.set_lease(req.lease());
    if (kv.lease() != 0) {
      leases[kv.lease()].keys.insert(kv.key());
    }
    kvs[kv.key()] = kv;

    mvccpb::Event ev;
    ev.set_type(mvccpb::Event::PUT);
    *ev.mutable_kv() = kv;
    if (not prev.key().empty()) {
      *ev.mutable_prev_kv() = prev;
    }
    publish(ev);
    return prev;
  }

  /// Delete a range of keys, requires mu to be held.
  std::vector<mvccpb::KeyValue> delete_range(std::string const& key, std::string const& range_end, std::int64_t rev) {
    std::vector<mvccpb::KeyValue> deleted;
    for (auto i = kvs.begin(); i != kvs.end();) {
      if (not in_range(i->first, key, range_end)) {
        ++i;
        continue;
      }
      deleted.push_back(i->second);
      unbind(i->second);
      mvccpb::Event ev;
      ev.set_type(mvccpb::Event::DELETE);
      ev.mutable_kv()->set_key(i->first);
      ev.mutable_kv()->set_mod_revision(rev);
      *ev.mutable_prev_kv() = i->second;
      i = kvs.erase(i);
      publish(ev);
    }
    return deleted;
  }

  void unbind(mvccpb::KeyValue const& kv) {
    if (kv.lease() == 0) {
      return;
    }
    auto l = leases.find(kv.lease());
    if (l != leases.end()) {
      l->second.keys.erase(kv.key());
    }
  }

  /// Count the keys in a delete range request, to decide if a new revision is needed.
  bool has_keys(std::string const& key, std::string const& range_end) const {
    for (auto const& kv : kvs) {
      if (in_range(kv.first, key, range_end)) {
        return true;
      }
    }
    return false;
  }

  etcdserverpb::RangeResponse range(etcdserverpb::RangeRequest const& req) const {
    if (req.revision() > 0 and req.revision() != revision) {
      throw store_error("reads at past revisions are not supported", grpc::StatusCode::UNIMPLEMENTED);
    }
    std::vector<mvccpb::KeyValue> matches;
    for (auto const& p : kvs) {
      auto const& kv = p.second;
      if (not in_range(kv.key(), req.key(), req.range_end())) {
        continue;
      }
      if (req.min_mod_revision() > 0 and kv.mod_revision() < req.min_mod_revision()) {
        continue;
      }
      if (req.max_mod_revision() > 0 and kv.mod_revision() > req.max_mod_revision()) {
        continue;
      }
      if (req.min_create_revision() > 0 and kv.create_revision() < req.min_create_revision()) {
        continue;
      }
      if (req.max_create_revision() > 0 and kv.create_revision() > req.max_create_revision()) {
        continue;
      }
      matches.push_back(kv);
    }

    auto order = req.sort_order();
    auto target = req.sort_target();
    if (order == etcdserverpb::RangeRequest::NONE and target != etcdserverpb::RangeRequest::KEY) {
      order = etcdserverpb::RangeRequest::ASCEND;
    }
    if (order != etcdserverpb::RangeRequest::NONE) {
      auto less = [target](mvccpb::KeyValue const& a, mvccpb::KeyValue const& b) {
        if (target == etcdserverpb::RangeRequest::KEY) {
          return a.key() < b.key();
        }
        if (target == etcdserverpb::RangeRequest::VALUE) {
          return a.value() < b.value();
        }
        return sort_value(a, target) < sort_value(b, target);
      };
      std::stable_sort(matches.begin(), matches.end(), less);
      if (order == etcdserverpb::RangeRequest::DESCEND) {
        std::reverse(matches.begin(), matches.end());
      }
    }

    etcdserverpb::RangeResponse resp;
    resp.mutable_header()->set_revision(revision);
    resp.set_count(static_cast<std::int64_t>(matches.size()));
    if (req.count_only()) {
      return resp;
    }
    std::size_t limit = matches.size();
    if (req.limit() > 0 and static_cast<std::size_t>(req.limit()) < limit) {
      limit = static_cast<std::size_t>(req.limit());
      resp.set_more(true);
    }
    for (std::size_t i = 0; i != limit; ++i) {
      auto& kv = *resp.add_kvs();
      kv = matches[i];
      if (req.keys_only()) {
        kv.clear_value();
      }
    }
    return resp;
  }

  bool evaluate(etcdserverpb::Compare const& cmp) const {
    if (cmp.range_end().empty()) {
      auto i = kvs.find(cmp.key());
      if (i == kvs.end()) {
        if (cmp.target() == etcdserverpb::Compare::VALUE) {
          return false;
        }
        return compare_kv(cmp, mvccpb::KeyValue());
      }
      return compare_kv(cmp, i->second);
    }
    bool found = false;
    for (auto const& p : kvs) {
      if (not in_range(p.first, cmp.key(), cmp.range_end())) {
        continue;
      }
      found = true;
      if (not compare_kv(cmp, p.second)) {
        return false;
      }
    }
    if (not found) {
      return cmp.target() != etcdserverpb::Compare::VALUE and compare_kv(cmp, mvccpb::KeyValue());
    }
    return true;
  }

  /// Remove a lease and delete its keys, requires mu to be held.
  std::shared_ptr<lost_slot> remove_lease(std::int64_t lease_id) {
    auto l = leases.find(lease_id);
    if (l == leases.end()) {
      return std::shared_ptr<lost_slot>();
    }
    auto keys = l->second.keys;
    auto slot = l->second.slot;
    if (not keys.empty()) {
      auto rev = ++revision;
      for (auto const& k : keys) {
        delete_range(k, std::string(), rev);
      }
    }
    leases.erase(lease_id);
    return slot;
  }
};

class in_memory_store::state::lease_impl : public lease {
public:
  lease_impl(std::shared_ptr<state> s, std::int64_t id, std::chrono::seconds ttl, std::shared_ptr<lost_slot> slot)
      : state_(std::move(s))
      , lease_id_(id)
      , ttl_(ttl)
      , slot_(std::move(slot)) {
  }

  ~lease_impl() noexcept(false) override {
    slot_->close();
  }

  std::int64_t lease_id() const override {
    return lease_id_;
  }

  std::chrono::milliseconds actual_TTL() const override {
    return std::chrono::duration_cast<std::chrono::milliseconds>(ttl_);
  }

  bool is_active() const override {
    std::lock_guard<std::mutex> lock(state_->mu);
    return state_->leases.find(lease_id_) != state_->leases.end();
  }

  void revoke() override {
    // ... no lost notifications after revoke(), even if it fails ...
    slot_->close();
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->check_failure("revoke");
      state_->remove_lease(lease_id_);
    }
    state_->drain();
  }

  void on_lost(lost_handler handler) override {
    std::lock_guard<std::mutex> lock(slot_->mu);
    slot_->handler = std::move(handler);
  }

private:
  std::shared_ptr<state> state_;
  std::int64_t lease_id_;
  std::chrono::seconds ttl_;
  std::shared_ptr<lost_slot> slot_;
};

class in_memory_store::state::watcher_impl : public watcher {
public:
  watcher_impl(std::shared_ptr<state> s, std::shared_ptr<watch_record> w)
      : state_(std::move(s))
      , watch_(std::move(w)) {
  }

  ~watcher_impl() noexcept(false) override {
    cancel();
  }

  void cancel() override {
    {
      std::lock_guard<std::mutex> lock(state_->mu);
      state_->watches.erase(watch_);
    }
    // ... wait for any handler running in another thread ...
    std::lock_guard<std::recursive_mutex> dispatch(state_->dispatch_mu);
    watch_->closed = true;
  }

private:
  std::shared_ptr<state> state_;
  std::shared_ptr<watch_record> watch_;
};

in_memory_store::in_memory_store()
    : state_(std::make_shared<state>()) {
}

in_memory_store::~in_memory_store() noexcept(false) {
}

etcdserverpb::TxnResponse in_memory_store::txn(etcdserverpb::TxnRequest const& req) {
  etcdserverpb::TxnResponse resp;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->check_failure("txn");
    bool succeeded = true;
    for (auto const& cmp : req.compare()) {
      if (not state_->evaluate(cmp)) {
        succeeded = false;
        break;
      }
    }
    auto const& ops = succeeded ? req.success() : req.failure();

    // ... all the writes in a transaction share a single revision ...
    bool writes = false;
    for (auto const& op : ops) {
      if (op.has_request_put()) {
        writes = true;
      } else if (op.has_request_delete_range()) {
        auto const& d = op.request_delete_range();
        writes = writes or state_->has_keys(d.key(), d.range_end());
      } else if (op.has_request_txn()) {
        throw store_error("nested transactions are not supported", grpc::StatusCode::UNIMPLEMENTED);
      }
    }
    // ... validate the leases before any mutation, transactions are atomic ...
    for (auto const& op : ops) {
      if (op.has_request_put() and op.request_put().lease() != 0
          and state_->leases.find(op.request_put().lease()) == state_->leases.end()) {
        throw store_error("etcdserver: requested lease not found", grpc::StatusCode::NOT_FOUND);
      }
    }
    auto rev = writes ? state_->revision + 1 : state_->revision;
    if (writes) {
      state_->revision = rev;
    }
    for (auto const& op : ops) {
      auto& r = *resp.add_responses();
      if (op.has_request_range()) {
        *r.mutable_response_range() = state_->range(op.request_range());
      } else if (op.has_request_put()) {
        auto prev = state_->put(op.request_put(), rev);
        auto& p = *r.mutable_response_put();
        p.mutable_header()->set_revision(rev);
        if (op.request_put().prev_kv() and not prev.key().empty()) {
          *p.mutable_prev_kv() = prev;
        }
      } else if (op.has_request_delete_range()) {
        auto const& d = op.request_delete_range();
        auto deleted = state_->delete_range(d.key(), d.range_end(), rev);
        auto& dr = *r.mutable_response_delete_range();
        dr.mutable_header()->set_revision(rev);
        dr.set_deleted(static_cast<std::int64_t>(deleted.size()));
        if (d.prev_kv()) {
          for (auto const& kv : deleted) {
            *dr.add_prev_kvs() = kv;
          }
        }
      }
    }
    resp.set_succeeded(succeeded);
    resp.mutable_header()->set_revision(state_->revision);
  }
  state_->drain();
  return resp;
}

etcdserverpb::RangeResponse in_memory_store::range(etcdserverpb::RangeRequest const& req) {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->check_failure("range");
  return state_->range(req);
}

etcdserverpb::PutResponse in_memory_store::put(etcdserverpb::PutRequest const& req) {
  etcdserverpb::PutResponse resp;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->check_failure("put");
    if (req.lease() != 0 and state_->leases.find(req.lease()) == state_->leases.end()) {
      throw store_error("etcdserver: requested lease not found", grpc::StatusCode::NOT_FOUND);
    }
    auto rev = ++state_->revision;
    auto prev = state_->put(req, rev);
    resp.mutable_header()->set_revision(rev);
    if (req.prev_kv() and not prev.key().empty()) {
      *resp.mutable_prev_kv() = prev;
    }
  }
  state_->drain();
  return resp;
}

etcdserverpb::DeleteRangeResponse in_memory_store::delete_range(etcdserverpb::DeleteRangeRequest const& req) {
  etcdserverpb::DeleteRangeResponse resp;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->check_failure("delete_range");
    if (state_->has_keys(req.key(), req.range_end())) {
      auto rev = ++state_->revision;
      auto deleted = state_->delete_range(req.key(), req.range_end(), rev);
      resp.set_deleted(static_cast<std::int64_t>(deleted.size()));
      if (req.prev_kv()) {
        for (auto const& kv : deleted) {
          *resp.add_prev_kvs() = kv;
        }
      }
    }
    resp.mutable_header()->set_revision(state_->revision);
  }
  state_->drain();
  return resp;
}

std::shared_ptr<lease> in_memory_store::grant_lease(std::chrono::seconds ttl) {
  if (ttl.count() <= 0) {
    throw store_error("etcdserver: invalid lease TTL", grpc::StatusCode::INVALID_ARGUMENT);
  }
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->check_failure("grant_lease");
  auto id = ++state_->next_lease_id;
  auto slot = std::make_shared<lost_slot>();
  state_->leases[id] = lease_record{ttl, {}, slot};
  return std::make_shared<state::lease_impl>(state_, id, ttl, slot);
}

std::unique_ptr<watcher>
in_memory_store::watch(etcdserverpb::WatchCreateRequest const& req, event_handler on_event, error_handler on_error) {
  auto w = std::make_shared<watch_record>();
  w->key = req.key();
  w->range_end = req.range_end();
  for (auto f : req.filters()) {
    if (f == etcdserverpb::WatchCreateRequest::NOPUT) {
      w->no_put = true;
    } else if (f == etcdserverpb::WatchCreateRequest::NODELETE) {
      w->no_delete = true;
    }
  }
  w->prev_kv = req.prev_kv();
  w->on_event = std::move(on_event);
  w->on_error = std::move(on_error);

  std::unique_ptr<watcher> result;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    state_->check_failure("watch");
    auto start = req.start_revision();
    if (start > 0 and start < state_->compact_revision) {
      std::ostringstream os;
      os << "watch on " << req.key() << " cannot start at revision " << start;
      state_->pending.push_back(pending_delivery{
          w, mvccpb::Event(), std::make_exception_ptr(compacted_error(os.str(), state_->compact_revision))});
    } else {
      // ... replay the history, then the watch is registered for new events, all under the same lock ...
      if (start > 0) {
        for (auto const& ev : state_->history) {
          if (ev.kv().mod_revision() >= start) {
            state_->enqueue(w, ev);
          }
        }
      }
      state_->watches.insert(w);
    }
    result.reset(new state::watcher_impl(state_, w));
  }
  state_->drain();
  return result;
}

std::int64_t in_memory_store::revision() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->revision;
}

void in_memory_store::expire_lease(std::int64_t lease_id) {
  std::shared_ptr<lost_slot> slot;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    slot = state_->remove_lease(lease_id);
  }
  state_->drain();
  if (slot) {
    BALLOT_LOG(info) << "in_memory_store: lease " << lease_id << " expired";
    slot->fire();
  }
}

void in_memory_store::lose_lease(std::int64_t lease_id) {
  std::shared_ptr<lost_slot> slot;
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    auto l = state_->leases.find(lease_id);
    if (l == state_->leases.end()) {
      return;
    }
    slot = l->second.slot;
  }
  BALLOT_LOG(info) << "in_memory_store: lease " << lease_id << " lost";
  slot->fire();
}

void in_memory_store::compact(std::int64_t revision) {
  std::lock_guard<std::mutex> lock(state_->mu);
  if (revision > state_->revision) {
    throw store_error("etcdserver: mvcc: required revision is a future revision", grpc::StatusCode::OUT_OF_RANGE);
  }
  if (revision <= state_->compact_revision) {
    throw compacted_error("etcdserver: mvcc: required revision has been compacted", state_->compact_revision);
  }
  state_->compact_revision = revision;
  auto& h = state_->history;
  h.erase(
      std::remove_if(h.begin(), h.end(), [revision](mvccpb::Event const& ev) { return ev.kv().mod_revision() < revision; }),
      h.end());
}

void in_memory_store::inject_failures(std::string const& operation, int count) {
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->failures[operation] = count;
}

void in_memory_store::fail_watches() {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    for (auto const& w : state_->watches) {
      state_->pending.push_back(pending_delivery{
          w, mvccpb::Event(), std::make_exception_ptr(store_error("watch stream broken", grpc::StatusCode::UNAVAILABLE))});
    }
    state_->watches.clear();
  }
  state_->drain();
}

std::size_t in_memory_store::active_watches() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->watches.size();
}

std::size_t in_memory_store::active_leases() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->leases.size();
}

} // namespace testing
} // namespace ballot
