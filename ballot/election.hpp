#ifndef ballot_election_hpp
#define ballot_election_hpp

#include <ballot/detail/leader_observer.hpp>
#include <ballot/store.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ballot {

/**
 * Participate in, and observe, a fair leader election.
 *
 * Each candidate creates a key named after its lease under the election prefix.  The candidate whose key has the
 * lowest creation revision is the leader, the others wait, in creation order, until all the keys created before theirs
 * are deleted.  Keys are deleted when a candidate resigns, or when its lease expires because the process died.
 *
 * The campaign(), proclaim(), and resign() operations are not designed for concurrent use on the same object, the
 * application must serialize them.  Different objects, in the same or different processes, compete safely.
 */
class election {
public:
  //@{
  /// @name type traits
  using leader_handler = detail::leader_observer::leader_handler;
  using error_handler = detail::leader_observer::error_handler;
  //@}

  /**
   * Create an election object, without contacting the store.
   *
   * @param s the store holding the election.
   * @param name the name of the election.
   * @param ttl the time-to-live for the candidate lease.
   * @param ns the namespace for elections, the keys are named @a ns + "/" + @a name + "/" + lease id.
   */
  election(
      std::shared_ptr<store> s, std::string name, std::chrono::seconds ttl = std::chrono::seconds(60),
      std::string const& ns = "election");

  election(election const&) = delete;
  election& operator=(election const&) = delete;

  /**
   * Release local resources.
   *
   * The destructor stops the observer and the lease keep alives.  It makes no attempt to resign from the election, or
   * to revoke the lease, the application should call resign() before the destructor if it wants to release the
   * leadership immediately.
   */
  ~election() noexcept(false);

  /// Obtain a lease, if this object does not have one already.
  void initialize();

  /**
   * Become a candidate, and block until this candidate is the leader.
   *
   * If the candidate key for the current lease exists its position in the election is preserved, and its value is
   * updated if needed.  On failure the campaign is resigned before the exception propagates.
   *
   * @throws ballot::store_error if the store fails.
   */
  void campaign(std::string const& value);

  /**
   * Update the value published by this candidate.
   *
   * @throws ballot::not_leader_error if there is no active campaign, the candidate key was deleted, or the lease
   *     holding the candidate key was lost.
   */
  void proclaim(std::string const& value);

  /**
   * Give up the leadership, or the position in line.  Does nothing if there is no active campaign.
   *
   * If the candidate key is gone, or its lease was lost, the current lease is revoked instead.  The next initialize()
   * or campaign() obtains a new one.
   */
  void resign();

  /**
   * Return the key of the current leader.
   *
   * @throws ballot::no_leader_error if there are no candidates.
   */
  std::string get_leader();

  //@{
  /// @name accessors
  std::string leader_key() const;
  std::int64_t leader_revision() const;
  bool is_ready() const;
  bool is_campaigning() const;
  bool is_observing() const;
  std::int64_t lease_id() const;
  std::string const& name() const {
    return name_;
  }
  std::string const& prefix() const {
    return prefix_;
  }
  std::chrono::seconds ttl() const {
    return ttl_;
  }
  //@}

  /**
   * Receive a notification each time a leader is identified.
   *
   * The first subscriber starts a background thread observing the election.  The same leader may be reported more
   * than once, in particular after errors.  Errors observing the election, or recovering a lost lease, are delivered
   * to @a on_error.
   *
   * @returns a token for unsubscribe().
   */
  long subscribe(leader_handler on_leader, error_handler on_error = error_handler());

  /// Stop receiving notifications, raises std::invalid_argument if the token is not valid.
  void unsubscribe(long token);

private:
  /// Called by the lease when it can no longer be kept alive.
  void on_lease_lost(std::int64_t lease_id);

  /// Obtain a new lease after a lost notification.
  void recovery_loop();

  /// Wait until all the candidates created before @a revision are gone.
  void wait_for_turn(std::int64_t revision);

private:
  std::shared_ptr<store> store_;
  std::string name_;
  std::string prefix_;
  std::chrono::seconds ttl_;

  /// Serialize initialize() between the application and the recovery thread.
  std::mutex init_mu_;

  mutable std::mutex mu_;
  std::shared_ptr<lease> lease_;
  std::int64_t lease_id_;
  std::string leader_key_;
  std::int64_t leader_revision_;
  std::int64_t campaign_lease_id_;
  bool campaigning_;

  std::condition_variable recovery_cv_;
  std::shared_ptr<lease> lost_lease_;
  bool recovery_pending_;
  bool shutdown_;
  std::thread recovery_thread_;

  detail::leader_observer observer_;
};

} // namespace ballot

#endif // ballot_election_hpp
