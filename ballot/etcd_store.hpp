#ifndef ballot_etcd_store_hpp
#define ballot_etcd_store_hpp

#include <ballot/active_completion_queue.hpp>
#include <ballot/store.hpp>

#include <grpc++/grpc++.h>

#include <memory>
#include <string>

namespace ballot {
namespace detail {
template <typename completion_queue_type>
class etcd_store_impl;
} // namespace detail

/**
 * A ballot::store backed by an etcd cluster.
 *
 * The store runs all its asynchronous operations on a shared ballot::active_completion_queue.  Leases and watchers
 * created by the store keep the queue alive, so they can safely outlive the store object itself.
 *
 * @code
 * auto store = std::make_shared<ballot::etcd_store>("localhost:2379");
 * ballot::election election(store, "my-service");
 * election.campaign("host-1:8080");
 * @endcode
 */
class etcd_store : public store {
public:
  /// Connect to the etcd server at @a address, with its own completion queue.
  explicit etcd_store(std::string const& address);

  /// Use an existing channel and completion queue.
  etcd_store(std::shared_ptr<grpc::Channel> channel, std::shared_ptr<active_completion_queue> queue);

  etcd_store(etcd_store const&) = delete;
  etcd_store& operator=(etcd_store const&) = delete;

  ~etcd_store() noexcept(false) override;

  //@{
  /// @name implement the store interface using the pimpl idiom.
  etcdserverpb::TxnResponse txn(etcdserverpb::TxnRequest const& req) override;
  etcdserverpb::RangeResponse range(etcdserverpb::RangeRequest const& req) override;
  etcdserverpb::PutResponse put(etcdserverpb::PutRequest const& req) override;
  etcdserverpb::DeleteRangeResponse delete_range(etcdserverpb::DeleteRangeRequest const& req) override;
  std::shared_ptr<lease> grant_lease(std::chrono::seconds ttl) override;
  std::unique_ptr<watcher>
  watch(etcdserverpb::WatchCreateRequest const& req, event_handler on_event, error_handler on_error) override;
  //@}

  std::shared_ptr<grpc::Channel> channel() const {
    return channel_;
  }

private:
  std::shared_ptr<active_completion_queue> queue_;
  std::shared_ptr<grpc::Channel> channel_;
  std::unique_ptr<detail::etcd_store_impl<completion_queue<>>> impl_;
};

} // namespace ballot

#endif // ballot_etcd_store_hpp
