#ifndef ballot_store_hpp
#define ballot_store_hpp

#include <ballot/lease.hpp>
#include <ballot/watcher.hpp>

#include <etcd/etcdserver/etcdserverpb/rpc.pb.h>

#include <chrono>
#include <exception>
#include <functional>
#include <memory>

namespace ballot {

/**
 * Define the interface for the key-value store used by the election protocol.
 *
 * The store provides monotonically increasing revisions, conditional transactions, time-bound leases, and watches.
 * The interface is expressed with the etcd v3 protocol messages, ballot::etcd_store forwards the requests to an etcd
 * cluster, ballot::testing::in_memory_store implements them in memory for testing.
 *
 * All operations block until the store responds and raise ballot::store_error on failure.
 */
class store {
public:
  //@{
  /// @name type traits
  /// Called for each event received by a watch.
  using event_handler = std::function<void(mvccpb::Event const&)>;
  /// Called once if the watch fails, no events are delivered after an error.
  using error_handler = std::function<void(std::exception_ptr)>;
  //@}

  virtual ~store() noexcept(false) = 0;

  /// Commit a conditional transaction.
  virtual etcdserverpb::TxnResponse txn(etcdserverpb::TxnRequest const& req) = 0;

  /// Read a key or range of keys.
  virtual etcdserverpb::RangeResponse range(etcdserverpb::RangeRequest const& req) = 0;

  /// Create or update a key.
  virtual etcdserverpb::PutResponse put(etcdserverpb::PutRequest const& req) = 0;

  /// Delete a key or range of keys.
  virtual etcdserverpb::DeleteRangeResponse delete_range(etcdserverpb::DeleteRangeRequest const& req) = 0;

  /**
   * Grant a new lease and keep it alive.
   *
   * @param ttl the requested time-to-live, the store may grant a different value.
   */
  virtual std::shared_ptr<lease> grant_lease(std::chrono::seconds ttl) = 0;

  /**
   * Watch a key or a range of keys.
   *
   * When @a req has a start_revision the events since that revision are replayed first.  The watch reports a
   * ballot::compacted_error if that revision is no longer available.
   *
   * @param req the key, range_end, start_revision, filters and prev_kv settings for the watch.
   * @param on_event called for each event in the watch, in revision order.
   * @param on_error called at most once if the watch fails.
   * @returns an object to cancel the watch.
   */
  virtual std::unique_ptr<watcher>
  watch(etcdserverpb::WatchCreateRequest const& req, event_handler on_event, error_handler on_error) = 0;
};

} // namespace ballot

#endif // ballot_store_hpp
