#pragma once

#include <cstdint>

namespace osr {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source and sleeper
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that hides std::chrono::system_clock and
//         std::this_thread::sleep_for from the lifecycle components.
//
// @details
// Every timestamp written to the history (created_at, last_updated_at) and
// every retry backoff goes through this interface:
//   - LiveTimeProvider       → system_clock, real sleeps.
//   - SimulationTimeProvider → a clock set by the test; sleep_ms() advances
//                              it instantly, so retry tests run without
//                              waiting and can assert on elapsed time.
//
// Time is int64_t milliseconds since the Unix epoch. This is the unit the
// history file stores (rendered as ISO-8601 with milliseconds) and the unit
// of every configured timeout and backoff.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent use from multiple threads.
//   Several operations on different ids may back off at the same time.
//
// Ownership:
//   Components hold a reference; they do NOT own the provider. The
//   provider's lifetime must exceed that of all components that reference it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since 1970-01-01 00:00:00 UTC.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // -------------------------------------------------------------------------
  // sleep_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Blocks the calling thread for duration_ms (live), or moves the
  //         clock forward by duration_ms and returns at once (simulated).
  //
  // Non-positive durations return immediately.
  // -------------------------------------------------------------------------
  virtual void sleep_ms(std::int64_t duration_ms) = 0;
};

}  // namespace osr
