#ifndef ballot_log_severity_hpp
#define ballot_log_severity_hpp
/**
 * @file
 *
 * Define the log severity values and the compile-time threshold.
 */

#include <iosfwd>

#ifndef BALLOT_MIN_SEVERITY
/**
 * All log messages below this level are disabled at compile time.
 *
 * Disabled messages become no-op's that the optimizer can remove, so the library can carry detailed tracing of the
 * election protocol without paying for it in production builds.
 */
#define BALLOT_MIN_SEVERITY info
#endif // BALLOT_MIN_SEVERITY

namespace ballot {
/**
 * The severity levels for ballot logging, modelled after syslog(3).
 */
enum class severity {
  /// Entering and leaving functions, individual asynchronous operations.
  trace,
  /// Debug messages that should not be present in production.
  debug,
  /// Normal progress, such as a candidate being elected.
  info,
  /// Unusual but expected conditions, such as a watch restarted after compaction.
  notice,
  /// Problems the application may need to act upon, such as a lost lease.
  warning,
  /// An error has been detected.  Do not use for normal conditions, such as a candidate losing an election.
  error,
  /// The system is in a critical state, such as running out of local resources.
  critical,
  /// The system is at risk of immediate failure.
  alert,
  /// The system is about to crash or terminate.
  fatal,
  /// The highest possible severity level.
  HIGHEST = int(fatal),
  /// The lowest possible severity level.
  LOWEST = int(trace),
  /// The lowest level that is enabled at compile-time.
  LOWEST_ENABLED = int(BALLOT_MIN_SEVERITY),
};

/// Streaming operator, writes a human readable representation.
std::ostream& operator<<(std::ostream& os, severity x);

} // namespace ballot

#endif // ballot_log_severity_hpp
