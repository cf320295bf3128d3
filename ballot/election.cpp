#include "ballot/election.hpp"
#include <ballot/assert_throw.hpp>
#include <ballot/detail/grpc_errors.hpp>
#include <ballot/detail/wait_for_delete.hpp>
#include <ballot/errors.hpp>
#include <ballot/log.hpp>
#include <ballot/prefix_end.hpp>

#include <vector>

namespace ballot {
namespace {
/// Build a request to compare the creation revision of @a key.
etcdserverpb::Compare create_revision_is(std::string const& key, std::int64_t revision) {
  etcdserverpb::Compare cmp;
  cmp.set_key(key);
  cmp.set_result(etcdserverpb::Compare::EQUAL);
  cmp.set_target(etcdserverpb::Compare::CREATE);
  cmp.set_create_revision(revision);
  return cmp;
}
} // anonymous namespace

election::election(std::shared_ptr<store> s, std::string name, std::chrono::seconds ttl, std::string const& ns)
    : store_(std::move(s))
    , name_(std::move(name))
    , prefix_(ns + "/" + name_ + "/")
    , ttl_(ttl)
    , init_mu_()
    , mu_()
    , lease_()
    , lease_id_(0)
    , leader_key_()
    , leader_revision_(0)
    , campaign_lease_id_(0)
    , campaigning_(false)
    , recovery_cv_()
    , lost_lease_()
    , recovery_pending_(false)
    , shutdown_(false)
    , recovery_thread_()
    , observer_(store_, prefix_) {
}

election::~election() noexcept(false) {
  observer_.shutdown();
  std::thread t;
  {
    std::lock_guard<std::mutex> lock(mu_);
    shutdown_ = true;
    t = std::move(recovery_thread_);
  }
  recovery_cv_.notify_all();
  if (t.joinable()) {
    t.join();
  }
  // ... the recovery thread may have installed a new lease, take it after the thread is gone ...
  std::shared_ptr<lease> l;
  {
    std::lock_guard<std::mutex> lock(mu_);
    l = std::move(lease_);
  }
  if (l) {
    l->on_lost(lease::lost_handler());
  }
}

void election::initialize() {
  std::lock_guard<std::mutex> init(init_mu_);
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (lease_) {
      return;
    }
  }
  // ... the store calls are made without holding mu_, the lost handler needs it ...
  auto l = store_->grant_lease(ttl_);
  auto id = l->lease_id();
  {
    std::lock_guard<std::mutex> lock(mu_);
    lease_ = l;
    lease_id_ = id;
  }
  l->on_lost([this, id]() { this->on_lease_lost(id); });
  BALLOT_LOG(info) << "election " << prefix_ << " obtained lease " << id << ", ttl=" << l->actual_TTL().count()
                   << "ms";
  // ... the lease may have been lost before the handler was registered ...
  if (not l->is_active()) {
    on_lease_lost(id);
  }
}

void election::campaign(std::string const& value) {
  initialize();
  try {
    std::int64_t id;
    {
      std::lock_guard<std::mutex> lock(mu_);
      id = lease_id_;
    }
    if (id == 0) {
      throw store_error("lease lost before the campaign in " + prefix_, grpc::StatusCode::UNAVAILABLE);
    }
    auto key = prefix_ + std::to_string(id);

    // ... create the candidate key, unless it already exists, in which case we read it ...
    etcdserverpb::TxnRequest req;
    *req.add_compare() = create_revision_is(key, 0);
    auto& on_success = *req.add_success()->mutable_request_put();
    on_success.set_key(key);
    on_success.set_value(value);
    on_success.set_lease(id);
    auto& on_failure = *req.add_failure()->mutable_request_range();
    on_failure.set_key(key);

    BALLOT_LOG(trace) << "campaign request " << detail::print_to_stream(req);
    auto resp = store_->txn(req);
    std::int64_t revision = resp.header().revision();
    bool update_value = false;
    if (not resp.succeeded()) {
      BALLOT_ASSERT_THROW(resp.responses_size() == 1);
      auto const& kvs = resp.responses(0).response_range().kvs();
      if (kvs.empty()) {
        throw store_error("candidate key " + key + " deleted during the campaign", grpc::StatusCode::ABORTED);
      }
      revision = kvs.Get(0).create_revision();
      update_value = kvs.Get(0).value() != value;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      leader_key_ = key;
      leader_revision_ = revision;
      campaign_lease_id_ = id;
      campaigning_ = true;
    }
    BALLOT_LOG(info) << "campaigning as " << key << ", creation revision=" << revision;

    if (update_value) {
      proclaim(value);
    }
    wait_for_turn(revision);
    BALLOT_LOG(info) << key << " elected leader of " << prefix_;
  } catch (std::exception const& ex) {
    BALLOT_LOG(info) << "campaign in " << prefix_ << " failed, resigning: " << ex.what();
    try {
      resign();
    } catch (std::exception const& resign_ex) {
      BALLOT_LOG(warning) << "resign after failed campaign in " << prefix_ << " also failed: " << resign_ex.what();
    }
    throw;
  }
}

void election::proclaim(std::string const& value) {
  std::string key;
  std::int64_t revision;
  std::int64_t id;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (not campaigning_ or leader_key_.empty()) {
      throw not_leader_error("proclaim() requires an active campaign in " + prefix_);
    }
    key = leader_key_;
    revision = leader_revision_;
    id = campaign_lease_id_;
  }

  etcdserverpb::TxnRequest req;
  *req.add_compare() = create_revision_is(key, revision);
  auto& on_success = *req.add_success()->mutable_request_put();
  on_success.set_key(key);
  on_success.set_value(value);
  on_success.set_lease(id);
  auto resp = store_->txn(req);
  if (not resp.succeeded()) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      leader_key_.clear();
    }
    throw not_leader_error("candidate key " + key + " was deleted or replaced");
  }
  BALLOT_LOG(debug) << "proclaimed new value for " << key;
}

void election::resign() {
  std::string key;
  std::int64_t revision;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (not campaigning_) {
      return;
    }
    key = leader_key_;
    revision = leader_revision_;
  }
  // ... the local state is cleared no matter how resign() exits ...
  struct clear_campaign {
    ~clear_campaign() {
      std::lock_guard<std::mutex> lock(self.mu_);
      self.leader_key_.clear();
      self.leader_revision_ = 0;
      self.campaign_lease_id_ = 0;
      self.campaigning_ = false;
    }
    election& self;
  } clear{*this};

  if (not key.empty()) {
    etcdserverpb::TxnRequest req;
    *req.add_compare() = create_revision_is(key, revision);
    req.add_success()->mutable_request_delete_range()->set_key(key);
    if (store_->txn(req).succeeded()) {
      BALLOT_LOG(info) << key << " resigned from " << prefix_;
      return;
    }
  }

  // ... the candidate key is gone or was replaced, revoke the lease so no key bound to it survives ...
  std::shared_ptr<lease> l;
  {
    std::lock_guard<std::mutex> lock(mu_);
    l = std::move(lease_);
    lease_id_ = 0;
  }
  if (not l) {
    return;
  }
  BALLOT_LOG(info) << "candidate key for " << prefix_ << " not found, revoking lease " << l->lease_id();
  l->on_lost(lease::lost_handler());
  l->revoke();
}

std::string election::get_leader() {
  etcdserverpb::RangeRequest req;
  req.set_key(prefix_);
  req.set_range_end(prefix_end(prefix_));
  req.set_sort_order(etcdserverpb::RangeRequest::ASCEND);
  req.set_sort_target(etcdserverpb::RangeRequest::CREATE);
  req.set_limit(1);
  req.set_keys_only(true);
  auto resp = store_->range(req);
  if (resp.kvs().empty()) {
    throw no_leader_error(prefix_);
  }
  return resp.kvs(0).key();
}

std::string election::leader_key() const {
  std::lock_guard<std::mutex> lock(mu_);
  return leader_key_;
}

std::int64_t election::leader_revision() const {
  std::lock_guard<std::mutex> lock(mu_);
  return leader_revision_;
}

bool election::is_ready() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lease_id_ != 0;
}

bool election::is_campaigning() const {
  std::lock_guard<std::mutex> lock(mu_);
  return campaigning_;
}

bool election::is_observing() const {
  return observer_.is_observing();
}

std::int64_t election::lease_id() const {
  std::lock_guard<std::mutex> lock(mu_);
  return lease_id_;
}

long election::subscribe(leader_handler on_leader, error_handler on_error) {
  return observer_.subscribe(std::move(on_leader), std::move(on_error));
}

void election::unsubscribe(long token) {
  observer_.unsubscribe(token);
}

void election::on_lease_lost(std::int64_t lease_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (shutdown_ or lease_id != lease_id_) {
    return;
  }
  BALLOT_LOG(warning) << "lease " << lease_id << " for " << prefix_ << " lost";
  // ... the candidate key is bound to the lost lease, it cannot be updated any more ...
  if (lease_id == campaign_lease_id_) {
    leader_key_.clear();
  }
  // ... the lease cannot be released from its own notification, the recovery thread does it ...
  lost_lease_ = std::move(lease_);
  lease_id_ = 0;
  recovery_pending_ = true;
  if (not recovery_thread_.joinable()) {
    recovery_thread_ = std::thread([this]() { this->recovery_loop(); });
  }
  recovery_cv_.notify_all();
}

void election::recovery_loop() {
  for (;;) {
    std::shared_ptr<lease> lost;
    {
      std::unique_lock<std::mutex> lock(mu_);
      recovery_cv_.wait(lock, [this]() { return shutdown_ or recovery_pending_; });
      recovery_pending_ = false;
      lost = std::move(lost_lease_);
      if (shutdown_) {
        return;
      }
    }
    // ... release the keep alive resources of the lost lease ...
    lost.reset();
    try {
      initialize();
    } catch (std::exception const& ex) {
      BALLOT_LOG(warning) << "cannot obtain a new lease for " << prefix_ << ": " << ex.what();
      observer_.report_error(std::current_exception());
    }
  }
}

void election::wait_for_turn(std::int64_t revision) {
  // ... a revision of 0 would disable the filter on the creation revision, and the store starts at revision 1 ...
  BALLOT_ASSERT_THROW(revision > 1);
  // ... all the candidates created before this one, closest first ...
  etcdserverpb::RangeRequest req;
  req.set_key(prefix_);
  req.set_range_end(prefix_end(prefix_));
  req.set_max_create_revision(revision - 1);
  req.set_sort_order(etcdserverpb::RangeRequest::DESCEND);
  req.set_sort_target(etcdserverpb::RangeRequest::CREATE);
  req.set_keys_only(true);
  auto resp = store_->range(req);

  std::vector<std::string> keys;
  for (auto const& kv : resp.kvs()) {
    keys.push_back(kv.key());
  }
  BALLOT_LOG(debug) << "waiting for " << keys.size() << " earlier candidates in " << prefix_;
  // ... watch from this read, an earlier candidate may resign and campaign again with the same key ...
  detail::wait_for_deletes(*store_, keys, resp.header().revision() + 1);
}

} // namespace ballot
