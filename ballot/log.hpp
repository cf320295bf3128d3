#ifndef ballot_log_hpp
#define ballot_log_hpp
/**
 * @file
 *
 * Define macros, types, and functions for logging in ballot.
 */
#include <ballot/detail/null_stream.hpp>
#include <ballot/log_severity.hpp>
#include <ballot/log_sink.hpp>

#include <memory>
#include <mutex>
#include <sstream>
#include <vector>

/// Concatenate two pre-processor tokens.
#define BALLOT_PP_CAT(a, b) a##b

/**
 * Create a (most likely) unique identifier for the logger object in BALLOT_LOG().
 *
 * The identifier depends on the line number, so it does not collide with variables in the enclosing scope.
 */
#define BALLOT_LOGGER_IDENTIFIER BALLOT_PP_CAT(ballot_log_, __LINE__)

/**
 * Log to an explicit @c ballot::log object.
 *
 * Mostly used in tests, the library and applications use BALLOT_LOG().
 */
#define BALLOT_LOG_I(level, sink)                                                                                      \
  for (auto BALLOT_LOGGER_IDENTIFIER = ballot::logger<ballot::level_compile_time_disabled(ballot::severity::level)>(   \
           ballot::severity::level, __func__, __FILE__, __LINE__, sink);                                               \
       (bool)BALLOT_LOGGER_IDENTIFIER; BALLOT_LOGGER_IDENTIFIER.write_to(sink))                                        \
  BALLOT_LOGGER_IDENTIFIER.get()

/**
 * Declare a logger named @a name, used to log messages assembled by more than one expression.
 */
#define BALLOT_LOGGER_DECL(level, sink, name)                                                                          \
  ballot::logger<ballot::level_compile_time_disabled(ballot::severity::level)> name(                                   \
      ballot::severity::level, __func__, __FILE__, __LINE__, sink)

#ifndef BALLOT_LOG
#define BALLOT_LOG(level) BALLOT_LOG_I(level, ballot::log::instance())
#endif // BALLOT_LOG

/**
 * Fair leader election over etcd.
 */
namespace ballot {
/**
 * The logging framework core.
 *
 * The library needs to log from deep inside asynchronous callbacks, where threading a logger parameter through every
 * class would complicate all the interfaces.  Instead the messages go to a singleton, and the application decides
 * where they end up by configuring its sinks.
 */
class log {
public:
  /// Normally use @c ballot::log::instance(), this is useful in testing.
  log()
      : mu_()
      , min_severity_(severity::LOWEST)
      , sinks_() {
  }

  /// Return the singleton instance
  static log& instance();

  /// Add a new sink.
  void add_sink(std::shared_ptr<log_sink> sink);

  /// Remove a sink previously added with add_sink(), ignored if not present.
  void remove_sink(std::shared_ptr<log_sink> const& sink);

  /// Remove all the sinks.
  void clear_sinks();

  /// Write a formatted message to all the sinks.
  void write(severity sev, std::string&& msg);

  /// Set the minimum run-time severity, each sink can implement additional filtering.
  void min_severity(severity sev) {
    std::lock_guard<std::mutex> guard(mu_);
    min_severity_ = sev;
  }

  /// Return the minimum run-time severity.
  severity min_severity() const {
    std::lock_guard<std::mutex> guard(mu_);
    return min_severity_;
  }

private:
  mutable std::mutex mu_;
  severity min_severity_;
  std::vector<std::shared_ptr<log_sink>> sinks_;

  static std::unique_ptr<log> singleton_;
};

/**
 * A compile-time disabled log message container.
 *
 * All the member functions are no-op's, the message is never formatted.
 */
template <bool disabled>
class logger {
public:
  logger(severity, char const*, char const*, int, log&) {
  }

  explicit operator bool() const {
    return false;
  }

  detail::null_stream& get() {
    return os_;
  }

  void write_to(log&) {
  }

private:
  detail::null_stream os_;
};

/**
 * A log message container.
 *
 * Formats the message into a std::ostringstream and sends the result to the sinks when the message is complete.
 */
template <>
class logger<false> {
public:
  logger(severity s, char const* func, char const* file, int lineno, log& sink);

  explicit operator bool() const {
    return not closed_;
  }

  /// Get the std::ostream where the message is formatted.
  std::ostream& get() {
    return os_;
  }

  /// Send the message to the sinks.
  void write_to(ballot::log& sink);

private:
  std::ostringstream os_;
  severity sev_;
  char const* function_;
  char const* filename_;
  int lineno_;
  bool closed_;
};

/**
 * Determine if a given severity level is disabled at compile-time.
 *
 * @param lvl the severity level to check.
 * @returns true if @a lvl is below BALLOT_MIN_SEVERITY.
 */
constexpr bool level_compile_time_disabled(severity lvl) {
  return lvl < ballot::severity::BALLOT_MIN_SEVERITY;
}
} // namespace ballot

#endif // ballot_log_hpp
