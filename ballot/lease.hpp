#ifndef ballot_lease_hpp
#define ballot_lease_hpp

#include <chrono>
#include <cstdint>
#include <functional>

namespace ballot {

/**
 * Define the interface for a lease, a time-bound liveness token kept alive by the store.
 *
 * Keys created with the lease are deleted by the store when the lease expires or is revoked.  The implementation
 * keeps the lease alive until it is revoked, destroyed, or lost.
 */
class lease {
public:
  //@{
  /// @name type traits
  /// The type of the functor called when the lease is lost.
  using lost_handler = std::function<void()>;
  //@}

  /**
   * Destroy a lease, releasing only local resources.
   *
   * No attempt is made to revoke the lease in the store, if the application wants to release the keys bound to the
   * lease it should call revoke() before destroying the object.  The lease will expire on its own otherwise.
   */
  virtual ~lease() noexcept(false) = 0;

  /// The lease id assigned by the store.
  virtual std::int64_t lease_id() const = 0;

  /// The TTL granted by the store, it may be different from the requested TTL.
  virtual std::chrono::milliseconds actual_TTL() const = 0;

  /// Return true while the lease is kept alive.
  virtual bool is_active() const = 0;

  /**
   * Revoke the lease.
   *
   * If successful, the pending keep alive operations are cancelled and the lease is revoked on the server.
   */
  virtual void revoke() = 0;

  /**
   * Set the functor called when the lease is lost.
   *
   * A lease is lost when it can no longer be kept alive, e.g. the keep alive stream broke or the store reports the
   * lease as expired.  The handler is called at most once, and never after revoke() or the destructor.  It may be
   * called from an internal thread, and it must not block.
   *
   * Calling on_lost() with a null handler unregisters the current handler, when on_lost() returns the previous handler
   * is not running and will not be called.
   */
  virtual void on_lost(lost_handler handler) = 0;
};

} // namespace ballot

#endif // ballot_lease_hpp
