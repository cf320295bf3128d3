#ifndef ballot_watcher_hpp
#define ballot_watcher_hpp

namespace ballot {

/**
 * Define the interface for an active watch on a key or range of keys.
 *
 * Created by ballot::store::watch().  The events and errors are delivered to the handlers provided at creation time.
 */
class watcher {
public:
  /// Destroy the watcher, implies cancel().
  virtual ~watcher() noexcept(false) = 0;

  /**
   * Cancel the watch.
   *
   * Blocks until no more handlers can be invoked.  It is safe to call cancel() more than once, but it must not be
   * called from inside one of the watch handlers.
   */
  virtual void cancel() = 0;
};

} // namespace ballot

#endif // ballot_watcher_hpp
