// =============================================================================
// time_utils_test.cpp
// =============================================================================
// Unit tests for the time helpers and providers.
//
// Validates:
//   - ISO-8601 millisecond formatting and strict parsing
//   - UTC date parsing with calendar validation
//   - SimulationTimeProvider: sleep_ms advances the clock and is counted
//   - OrderStateMachine transition table
// =============================================================================

#include "osr/lifecycle/order_state_machine.hpp"
#include "osr/time/simulation_time_provider.hpp"
#include "osr/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// 1. Format and parse agree; malformed text is rejected.
// -----------------------------------------------------------------------------
TEST(TimeUtilsTest, Iso8601Milliseconds) {
  EXPECT_EQ(osr::format_iso8601_ms(1'700'000'000'123),
            "2023-11-14T22:13:20.123Z");
  EXPECT_EQ(osr::format_iso8601_ms(0), "1970-01-01T00:00:00.000Z");

  EXPECT_EQ(osr::parse_iso8601_ms("2023-11-14T22:13:20.123Z"),
            1'700'000'000'123);
  EXPECT_EQ(osr::parse_iso8601_ms("2024-02-29T00:00:00.000Z"),
            1'709'164'800'000);

  EXPECT_FALSE(osr::parse_iso8601_ms("2023-11-14T22:13:20Z").has_value());
  EXPECT_FALSE(osr::parse_iso8601_ms("2023-13-01T00:00:00.000Z").has_value());
  EXPECT_FALSE(osr::parse_iso8601_ms("2023-02-29T00:00:00.000Z").has_value());
  EXPECT_FALSE(osr::parse_iso8601_ms("2023-11-14 22:13:20.123Z").has_value());
}

TEST(TimeUtilsTest, DateUtc) {
  EXPECT_EQ(osr::parse_date_utc("1970-01-02"), 86'400'000);
  EXPECT_EQ(osr::parse_date_utc("2023-11-14"), 1'699'920'000'000);
  EXPECT_FALSE(osr::parse_date_utc("2023-11-1").has_value());
  EXPECT_FALSE(osr::parse_date_utc("2023-04-31").has_value());
  EXPECT_FALSE(osr::parse_date_utc("yesterday!").has_value());
}

// -----------------------------------------------------------------------------
// 2. Simulated sleeps advance the clock, including from several threads.
// -----------------------------------------------------------------------------
TEST(SimulationTimeProviderTest, SleepAdvancesClock) {
  osr::SimulationTimeProvider clock(1000);
  clock.sleep_ms(250);
  clock.sleep_ms(0);
  EXPECT_EQ(clock.now_ms(), 1250);
  EXPECT_EQ(clock.sleep_count(), 1);

  std::vector<std::thread> threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back([&clock]() {
      for (int j = 0; j < 100; ++j) {
        clock.sleep_ms(10);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(clock.now_ms(), 1250 + 4 * 100 * 10);
  EXPECT_EQ(clock.total_slept_ms(), 250 + 4000);

  clock.advance_time(5);
  EXPECT_EQ(clock.now_ms(), 5);
}

// -----------------------------------------------------------------------------
// 3. Transition table: terminal states are final; Unknown can resolve.
// -----------------------------------------------------------------------------
TEST(OrderStateMachineTest, TransitionTable) {
  using osr::OrderStateMachine;
  using S = osr::domain::OrderStatus;

  EXPECT_TRUE(OrderStateMachine::isLegal(S::Pending, S::Sent));
  EXPECT_TRUE(OrderStateMachine::isLegal(S::Pending, S::Failed));
  EXPECT_FALSE(OrderStateMachine::isLegal(S::Pending, S::Cancelled));

  EXPECT_TRUE(OrderStateMachine::isLegal(S::Sent, S::Cancelled));
  EXPECT_TRUE(OrderStateMachine::isLegal(S::Sent, S::Unknown));
  EXPECT_FALSE(OrderStateMachine::isLegal(S::Sent, S::Pending));

  EXPECT_TRUE(OrderStateMachine::isLegal(S::Unknown, S::Sent));
  EXPECT_TRUE(OrderStateMachine::isLegal(S::Unknown, S::Completed));

  for (S terminal : {S::Failed, S::Cancelled, S::Completed}) {
    for (S next : {S::Pending, S::Sent, S::Failed, S::Cancelled, S::Unknown,
                   S::Completed}) {
      EXPECT_FALSE(OrderStateMachine::isLegal(terminal, next));
    }
  }
}
