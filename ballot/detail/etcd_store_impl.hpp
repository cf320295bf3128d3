#ifndef ballot_detail_etcd_store_impl_hpp
#define ballot_detail_etcd_store_impl_hpp

#include <ballot/completion_queue.hpp>
#include <ballot/detail/async_op_counter.hpp>
#include <ballot/detail/session_impl.hpp>
#include <ballot/detail/watcher_impl.hpp>
#include <ballot/store.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.grpc.pb.h>

#include <memory>

namespace ballot {
namespace detail {

/**
 * Implement ballot::store over the etcd v3 gRPC services.
 *
 * The unary requests block on futures, leases are ballot::detail::session_impl objects, and each watch is a
 * ballot::detail::watcher_impl.  All of them run their asynchronous operations on @a queue, which must outlive this
 * object and any leases or watchers it creates.
 *
 * @tparam completion_queue_type the completion queue, the tests use a mocked queue.
 */
template <typename completion_queue_type>
class etcd_store_impl : public ::ballot::store {
public:
  etcd_store_impl(
      completion_queue_type& queue, std::shared_ptr<etcdserverpb::KV::Stub> kv_stub,
      std::shared_ptr<etcdserverpb::Watch::Stub> watch_stub, std::shared_ptr<etcdserverpb::Lease::Stub> lease_stub)
      : queue_(queue)
      , kv_client_(std::move(kv_stub))
      , watch_client_(std::move(watch_stub))
      , lease_client_(std::move(lease_stub))
      , ops_() {
  }

  ~etcd_store_impl() noexcept(false) override {
    ops_.block_until_all_done();
  }

  etcdserverpb::TxnResponse txn(etcdserverpb::TxnRequest const& req) override {
    return call(&etcdserverpb::KV::Stub::AsyncTxn, req, "store/txn");
  }

  etcdserverpb::RangeResponse range(etcdserverpb::RangeRequest const& req) override {
    return call(&etcdserverpb::KV::Stub::AsyncRange, req, "store/range");
  }

  etcdserverpb::PutResponse put(etcdserverpb::PutRequest const& req) override {
    return call(&etcdserverpb::KV::Stub::AsyncPut, req, "store/put");
  }

  etcdserverpb::DeleteRangeResponse delete_range(etcdserverpb::DeleteRangeRequest const& req) override {
    return call(&etcdserverpb::KV::Stub::AsyncDeleteRange, req, "store/delete_range");
  }

  std::shared_ptr<lease> grant_lease(std::chrono::seconds ttl) override {
    return std::make_shared<session_impl<completion_queue_type>>(queue_, lease_client_, ttl);
  }

  std::unique_ptr<watcher>
  watch(etcdserverpb::WatchCreateRequest const& req, event_handler on_event, error_handler on_error) override {
    return std::unique_ptr<watcher>(new watcher_impl<completion_queue_type>(
        queue_, watch_client_, req, std::move(on_event), std::move(on_error)));
  }

private:
  /// Make a unary request on the KV service and block until it completes.
  template <typename M, typename W>
  typename async_rpc_op_requirements<M>::response_type
  call(M etcdserverpb::KV::Stub::*member, W const& request, char const* name) {
    async_op_tracer tracer(ops_, name);
    if (not tracer) {
      throw store_error(std::string(name) + " store is shutting down", grpc::StatusCode::CANCELLED);
    }
    W copy = request;
    return queue_.async_rpc(kv_client_.get(), member, std::move(copy), name, ballot::use_future()).get();
  }

private:
  completion_queue_type& queue_;
  std::shared_ptr<etcdserverpb::KV::Stub> kv_client_;
  std::shared_ptr<etcdserverpb::Watch::Stub> watch_client_;
  std::shared_ptr<etcdserverpb::Lease::Stub> lease_client_;
  async_op_counter ops_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_etcd_store_impl_hpp
