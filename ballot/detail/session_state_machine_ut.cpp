#include "ballot/detail/session_state_machine.hpp"

#include <gtest/gtest.h>

#include <sstream>

/**
 * @test Verify the normal lifecycle of a lease, from construction to revocation.
 */
TEST(session_state_machine, basic) {
  using s = ballot::detail::session_state;
  ballot::detail::session_state_machine machine;

  ASSERT_EQ(machine.current(), s::constructing);
  ASSERT_TRUE(machine.change_state("test-1", s::connecting));
  ASSERT_FALSE(machine.change_state("test-2", s::constructing));

  bool called = false;
  auto check_called = [&called]() { called = true; };
  ASSERT_TRUE(machine.change_state_action("test-3", s::connected, check_called));
  ASSERT_TRUE(called);
  called = false;
  ASSERT_FALSE(machine.change_state_action("test-4", s::connecting, check_called));
  ASSERT_FALSE(called);

  ASSERT_TRUE(machine.change_state("test", s::obtaining_lease));
  ASSERT_TRUE(machine.change_state("test", s::lease_obtained));
  ASSERT_TRUE(machine.change_state("test", s::waiting_for_timer));
  ASSERT_FALSE(machine.change_state("test", s::waiting_for_keep_alive_read));
  ASSERT_TRUE(machine.change_state("test", s::waiting_for_keep_alive_write));
  ASSERT_TRUE(machine.change_state("test", s::waiting_for_keep_alive_read));
  ASSERT_TRUE(machine.change_state("test", s::waiting_for_timer));
  ASSERT_TRUE(machine.change_state("test", s::revoking));
  // ... a revoked lease is never reported as lost ...
  ASSERT_FALSE(machine.change_state("test", s::lost));
  ASSERT_TRUE(machine.change_state("test", s::revoked));
  ASSERT_TRUE(machine.change_state("test", s::shutting_down));
  ASSERT_FALSE(machine.change_state("test", s::waiting_for_timer));
  ASSERT_FALSE(machine.change_state("test", s::revoking));
  ASSERT_FALSE(machine.change_state("test", s::lost));
  ASSERT_TRUE(machine.change_state("test", s::shutdown));
  ASSERT_FALSE(machine.change_state("test", s::shutting_down));
}

/**
 * @test Verify the transitions around a lost lease.
 */
TEST(session_state_machine, lost) {
  using s = ballot::detail::session_state;
  ballot::detail::session_state_machine machine;
  for (auto n : {s::connecting, s::connected, s::obtaining_lease, s::lease_obtained, s::waiting_for_timer,
                 s::waiting_for_keep_alive_write, s::waiting_for_keep_alive_read}) {
    ASSERT_TRUE(machine.change_state("test", n));
  }
  ASSERT_TRUE(machine.change_state("test", s::lost));
  // ... lost only once, and no more keep alive cycles ...
  EXPECT_FALSE(machine.change_state("test", s::lost));
  EXPECT_FALSE(machine.change_state("test", s::waiting_for_timer));
  EXPECT_FALSE(machine.change_state("test", s::waiting_for_keep_alive_write));
  // ... the application can still try to revoke it ...
  EXPECT_TRUE(machine.change_state("test", s::revoking));
  EXPECT_TRUE(machine.change_state("test", s::shutting_down));
}

/**
 * @test Verify that shutdown is possible from the intermediate states.
 */
TEST(session_state_machine, shutdown_any_time) {
  using s = ballot::detail::session_state;
  for (auto n : {s::constructing, s::connecting, s::connected, s::obtaining_lease, s::lease_obtained}) {
    ballot::detail::session_state_machine machine;
    for (auto p : {s::connecting, s::connected, s::obtaining_lease, s::lease_obtained}) {
      if (machine.current() == n) {
        break;
      }
      ASSERT_TRUE(machine.change_state("test", p));
    }
    EXPECT_TRUE(machine.change_state("test", s::shutting_down)) << "state=" << n;
  }
}

/**
 * @test Verify that the iostream operator for ballot::detail::session_state works as expected.
 */
TEST(session_state, streaming) {
  using s = ballot::detail::session_state;
  std::ostringstream os;
  os << " " << s::constructing << " " << s::connecting << " " << s::connected << " " << s::obtaining_lease << " "
     << s::lease_obtained << " " << s::waiting_for_timer << " " << s::waiting_for_keep_alive_write << " "
     << s::waiting_for_keep_alive_read << " " << s::lost << " " << s::revoking << " " << s::revoked << " "
     << s::shutting_down << " " << s::shutdown;
  ASSERT_EQ(
      os.str(), " constructing connecting connected obtaining_lease lease_obtained waiting_for_timer "
                "waiting_for_keep_alive_write waiting_for_keep_alive_read lost revoking revoked shutting_down shutdown");
}
