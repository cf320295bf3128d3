#ifndef ballot_testing_in_memory_store_hpp
#define ballot_testing_in_memory_store_hpp

#include <ballot/store.hpp>

#include <memory>
#include <string>

namespace ballot {
namespace testing {

/**
 * A ballot::store kept in memory, for unit tests.
 *
 * The store is linearizable: each mutation advances a single revision counter, keys record their create and mod
 * revisions, and watches receive the events in revision order.  Watches can replay the history from a start revision,
 * until it is compacted.  Leases do not expire on their own, the tests call expire_lease() to simulate an expired
 * lease, which deletes the keys bound to it and notifies the lost handler.
 *
 * The watch handlers are called from the thread making the mutation, after the store lock is released.  They must
 * not block, and should not call the store.
 */
class in_memory_store : public store {
public:
  in_memory_store();
  ~in_memory_store() noexcept(false) override;

  //@{
  /// @name implement the store interface
  etcdserverpb::TxnResponse txn(etcdserverpb::TxnRequest const& req) override;
  etcdserverpb::RangeResponse range(etcdserverpb::RangeRequest const& req) override;
  etcdserverpb::PutResponse put(etcdserverpb::PutRequest const& req) override;
  etcdserverpb::DeleteRangeResponse delete_range(etcdserverpb::DeleteRangeRequest const& req) override;
  std::shared_ptr<lease> grant_lease(std::chrono::seconds ttl) override;
  std::unique_ptr<watcher>
  watch(etcdserverpb::WatchCreateRequest const& req, event_handler on_event, error_handler on_error) override;
  //@}

  //@{
  /// @name test hooks

  /// The current revision of the store.
  std::int64_t revision() const;

  /// Simulate the expiration of a lease: delete its keys and notify the lost handler.
  void expire_lease(std::int64_t lease_id);

  /**
   * Simulate a broken keep alive: notify the lost handler, the lease and its keys remain in the store.
   *
   * The lease still expires, or can be revoked, later.
   */
  void lose_lease(std::int64_t lease_id);

  /// Discard the history before @a revision, watches starting before it fail with ballot::compacted_error.
  void compact(std::int64_t revision);

  /**
   * Fail the next @a count calls to @a operation with a ballot::store_error.
   *
   * @param operation one of "txn", "range", "put", "delete_range", "grant_lease", "watch", or "revoke".
   */
  void inject_failures(std::string const& operation, int count);

  /// Report a ballot::store_error to all the active watches, as if their streams broke.
  void fail_watches();

  /// The number of watches created and not yet cancelled.
  std::size_t active_watches() const;

  /// The number of leases granted and not yet revoked or expired.
  std::size_t active_leases() const;
  //@}

private:
  struct state;
  std::shared_ptr<state> state_;
};

} // namespace testing
} // namespace ballot

#endif // ballot_testing_in_memory_store_hpp
