#include "ballot/log.hpp"

#include <gmock/gmock.h>

namespace {
using captured_logs = std::vector<std::pair<ballot::severity, std::string>>;

std::shared_ptr<ballot::log_sink> capture_to(captured_logs& logs) {
  return ballot::make_log_sink(
      [&logs](ballot::severity sev, std::string&& msg) { logs.emplace_back(sev, std::move(msg)); });
}
} // anonymous namespace

/**
 * @test Verify that BALLOT_LOG_I() and the supporting classes work in the normal case.
 */
TEST(log, basic) {
  ballot::log lg;
  // ... logging without sinks is a no-op ...
  ASSERT_NO_THROW(BALLOT_LOG_I(error, lg) << "foo" << 4 << 2);
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG_I(error, lg) << "campaign failed"
                                          << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, ballot::severity::error);
  EXPECT_THAT(logs[0].second, StartsWith("[error] campaign failed 42"));
  EXPECT_THAT(logs[0].second, HasSubstr("log_ut.cpp"));
}

/**
 * @test Verify that messages below the run-time threshold are not even formatted.
 */
TEST(log, run_time_disable) {
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG_I(info, lg) << "elected"
                                         << " " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, ballot::severity::info);
  EXPECT_THAT(logs[0].second, StartsWith("[info] elected 42"));

  logs.clear();
  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  lg.min_severity(ballot::severity::warning);
  EXPECT_EQ(lg.min_severity(), ballot::severity::warning);
  ASSERT_NO_THROW(BALLOT_LOG_I(info, lg) << "elected " << f());
  EXPECT_EQ(logs.size(), 0UL);
  EXPECT_EQ(cnt, 0);
  EXPECT_EQ(f(), 42);
  EXPECT_EQ(cnt, 1);
}

/**
 * @test Verify that messages below BALLOT_MIN_SEVERITY are disabled at compile-time.
 */
TEST(log, compile_time_disable) {
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));

  int cnt = 0;
  auto f = [&cnt]() {
    ++cnt;
    return 42;
  };
  // ... enabled at run-time, but disabled at compile-time ...
  lg.min_severity(ballot::severity::trace);
  ASSERT_NO_THROW(BALLOT_LOG_I(debug, lg) << "testing 123 " << f());
  EXPECT_EQ(logs.size(), 0UL);
  EXPECT_EQ(cnt, 0);
}

/**
 * @test Verify that the BALLOT_LOG() macro and the singleton work as expected.
 */
TEST(log, instance_basic) {
  ballot::log& lg = ballot::log::instance();
  captured_logs logs;
  auto sink = capture_to(logs);
  lg.add_sink(sink);

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG(info) << "testing 123 " << 42);
  ASSERT_EQ(logs.size(), 1UL);
  EXPECT_EQ(logs[0].first, ballot::severity::info);
  EXPECT_THAT(logs[0].second, StartsWith("[info] testing 123 42"));

  lg.remove_sink(sink);
  ASSERT_NO_THROW(BALLOT_LOG(info) << "not captured");
  EXPECT_EQ(logs.size(), 1UL);
}

/**
 * @test Verify that each sink receives a copy of the message.
 */
TEST(log, multiple_sinks) {
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  lg.add_sink(ballot::make_log_sink([&logs](ballot::severity sev, std::string&& msg) {
    logs.emplace_back(sev, std::string("(2) ") + msg);
  }));

  using namespace ::testing;
  ASSERT_NO_THROW(BALLOT_LOG_I(error, lg) << "testing 123"
                                          << " " << 42);
  ASSERT_EQ(logs.size(), 2UL);
  EXPECT_THAT(logs[0].second, StartsWith("[error] testing 123 42"));
  EXPECT_THAT(logs[1].second, StartsWith("(2) [error] testing 123 42"));

  lg.clear_sinks();
  ASSERT_NO_THROW(BALLOT_LOG_I(error, lg) << "dropped");
  EXPECT_EQ(logs.size(), 2UL);
}

/**
 * @test Complete code coverage for ballot::logger<true>.
 */
TEST(log, logger_disabled) {
  // ... neither get() nor write_to() are used in normal operation, but they must compile and be no-op's ...
  ballot::log lg;
  captured_logs logs;
  lg.add_sink(capture_to(logs));
  ballot::logger<true> logger(ballot::severity::error, __func__, __FILE__, __LINE__, lg);

  EXPECT_FALSE(static_cast<bool>(logger));
  ASSERT_NO_THROW(logger.get() << "testing " << 123 << std::string(" ") << 42);
  EXPECT_TRUE((std::is_same<decltype(logger.get()), ballot::detail::null_stream&>::value));
  ASSERT_NO_THROW(logger.write_to(lg));
  EXPECT_EQ(logs.size(), 0U);
}
