#ifndef ballot_errors_hpp
#define ballot_errors_hpp
/**
 * @file
 *
 * Define the exceptions raised by ballot.
 */

#include <grpc++/grpc++.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ballot {

/**
 * The base class for election protocol errors.
 */
class election_error : public std::runtime_error {
public:
  explicit election_error(std::string const& what)
      : std::runtime_error(what) {
  }
};

/// Raised by election::get_leader() when there are no candidates.
class no_leader_error : public election_error {
public:
  explicit no_leader_error(std::string const& prefix);
};

/**
 * Raised when an operation requires leadership this election no longer holds.
 *
 * That is, proclaim() without an active campaign, or proclaim() after the candidate key was deleted or replaced.
 */
class not_leader_error : public election_error {
public:
  explicit not_leader_error(std::string const& what);
};

/**
 * Raised when a store operation fails.
 *
 * Network problems, rejected requests, and broken watch streams are all reported with this exception.  The election
 * layer does not interpret them, it simply propagates them.
 */
class store_error : public std::runtime_error {
public:
  explicit store_error(std::string const& what, grpc::StatusCode code = grpc::StatusCode::UNKNOWN)
      : std::runtime_error(what)
      , code_(code) {
  }

  /// The gRPC status code, UNKNOWN for errors that did not originate in a gRPC call.
  grpc::StatusCode code() const {
    return code_;
  }

private:
  grpc::StatusCode code_;
};

/**
 * Raised when a watch cannot continue because the history it needs was compacted.
 */
class compacted_error : public store_error {
public:
  compacted_error(std::string const& what, std::int64_t compact_revision);

  /// The oldest revision still available in the store.
  std::int64_t compact_revision() const {
    return compact_revision_;
  }

private:
  std::int64_t compact_revision_;
};

} // namespace ballot

#endif // ballot_errors_hpp
