#ifndef ballot_detail_session_state_machine_hpp
#define ballot_detail_session_state_machine_hpp

#include <iostream>
#include <mutex>

namespace ballot {
namespace detail {
/**
 * The states of an etcd lease held by a ballot::detail::session_impl.
 *
 * A session creates and maintains an etcd lease.  Its state changes in response to both asynchronous events from the
 * etcd server (keep alive responses, broken streams) and local member function calls from the application (revoke,
 * destruction).  This enum makes the state machine explicit, mostly to help debug the transitions through logging,
 * and to ignore requests that are invalid once certain states are reached.
 */
enum class session_state {
  /// Initial state
  constructing,
  /// Getting the bi-dir streaming RPC connection.
  connecting,
  /// Obtained the bi-dir streaming RPC connection.
  connected,
  /// Getting the lease.
  obtaining_lease,
  /// Lease obtained.
  lease_obtained,
  /// Waiting for timer to expire.
  waiting_for_timer,
  /// Waiting for the keep alive request to be sent.
  waiting_for_keep_alive_write,
  /// Waiting for the keep alive response.
  waiting_for_keep_alive_read,
  /// The keep alive stream broke or the server reported the lease as expired.
  lost,
  /// Revoking the lease.
  revoking,
  /// Lease revoked.
  revoked,
  /// Starting shutdown of local resources.
  shutting_down,
  /// Final state, shutdown complete.
  shutdown,
};

/**
 * The streaming operator for @c session_state.
 *
 * Mostly used for unit testing and debugging / logging messages.
 */
std::ostream& operator<<(std::ostream& os, session_state x);

/**
 * Implement the state machine for an etcd session.
 *
 * The idea is to have a small place to look at valid vs. invalid transitions and to centralize debug logging.  For
 * example, once a lease is revoked it cannot be reported as lost, and once it is lost no more keep alive requests are
 * sent.
 */
class session_state_machine {
public:
  session_state_machine();

  /// Return the current state.
  session_state current() const;

  /// Propose a state change, returns true if accepted.
  bool change_state(char const* where, session_state nstate);

  /// Propose a state change, returns true and calls @a functor if accepted.
  template <typename Functor>
  bool change_state_action(char const* where, session_state nstate, Functor&& functor) {
    std::lock_guard<std::mutex> lock(mu_);
    if (not check_change_state(where, nstate)) {
      return false;
    }
    functor();
    state_ = nstate;
    return true;
  }

private:
  /// Checks if a state transition is acceptable, logs the rejected ones.
  bool check_change_state(char const* where, session_state nstate) const;

  /// Checks if a state transition is acceptable.
  bool is_valid_transition(session_state nstate) const;

private:
  mutable std::mutex mu_;
  session_state state_;
};

} // namespace detail
} // namespace ballot

#endif // ballot_detail_session_state_machine_hpp
