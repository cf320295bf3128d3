#include "ballot/etcd_store.hpp"
#include <ballot/detail/etcd_store_impl.hpp>

namespace ballot {
namespace {
/// Keep the completion queue alive while a lease created by the store is in use.
class queue_holding_lease : public lease {
public:
  queue_holding_lease(std::shared_ptr<active_completion_queue> queue, std::shared_ptr<lease> lease)
      : queue_(std::move(queue))
      , lease_(std::move(lease)) {
  }
  ~queue_holding_lease() noexcept(false) override {
  }

  std::int64_t lease_id() const override {
    return lease_->lease_id();
  }
  std::chrono::milliseconds actual_TTL() const override {
    return lease_->actual_TTL();
  }
  bool is_active() const override {
    return lease_->is_active();
  }
  void revoke() override {
    lease_->revoke();
  }
  void on_lost(lost_handler handler) override {
    lease_->on_lost(std::move(handler));
  }

private:
  // ... the lease is released before the queue, the members are destroyed in reverse order ...
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<lease> lease_;
};

/// Keep the completion queue alive while a watcher created by the store is in use.
class queue_holding_watcher : public watcher {
public:
  queue_holding_watcher(std::shared_ptr<active_completion_queue> queue, std::unique_ptr<watcher> w)
      : queue_(std::move(queue))
      , watcher_(std::move(w)) {
  }
  ~queue_holding_watcher() noexcept(false) override {
  }

  void cancel() override {
    watcher_->cancel();
  }

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::unique_ptr<watcher> watcher_;
};
} // anonymous namespace

etcd_store::etcd_store(std::string const& address)
    : etcd_store(
          grpc::CreateChannel(address, grpc::InsecureChannelCredentials()),
          std::make_shared<active_completion_queue>()) {
}

etcd_store::etcd_store(std::shared_ptr<grpc::Channel> channel, std::shared_ptr<active_completion_queue> queue)
    : queue_(std::move(queue))
    , channel_(std::move(channel))
    , impl_(new detail::etcd_store_impl<completion_queue<>>(
          queue_->cq(), etcdserverpb::KV::NewStub(channel_), etcdserverpb::Watch::NewStub(channel_),
          etcdserverpb::Lease::NewStub(channel_))) {
}

etcd_store::~etcd_store() noexcept(false) {
}

etcdserverpb::TxnResponse etcd_store::txn(etcdserverpb::TxnRequest const& req) {
  return impl_->txn(req);
}

etcdserverpb::RangeResponse etcd_store::range(etcdserverpb::RangeRequest const& req) {
  return impl_->range(req);
}

etcdserverpb::PutResponse etcd_store::put(etcdserverpb::PutRequest const& req) {
  return impl_->put(req);
}

etcdserverpb::DeleteRangeResponse etcd_store::delete_range(etcdserverpb::DeleteRangeRequest const& req) {
  return impl_->delete_range(req);
}

std::shared_ptr<lease> etcd_store::grant_lease(std::chrono::seconds ttl) {
  return std::make_shared<queue_holding_lease>(queue_, impl_->grant_lease(ttl));
}

std::unique_ptr<watcher>
etcd_store::watch(etcdserverpb::WatchCreateRequest const& req, event_handler on_event, error_handler on_error) {
  return std::unique_ptr<watcher>(
      new queue_holding_watcher(queue_, impl_->watch(req, std::move(on_event), std::move(on_error))));
}

} // namespace ballot
