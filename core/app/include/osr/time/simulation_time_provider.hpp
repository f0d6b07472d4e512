#pragma once

#include "osr/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace osr {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock for tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "current time" is set explicitly by the caller
//         and whose sleeps complete instantly.
//
// @details
// The lifecycle engine backs off between transient send failures. With the
// live clock a test exercising three attempts would wait 200 ms + 400 ms.
// Here sleep_ms() adds the duration to the clock and returns, so:
//   - tests run as fast as the CPU allows,
//   - the elapsed simulated time is observable (total backoff == now_ms()
//     delta), and
//   - last_updated_at values are reproducible across runs.
//
// The retention sweeper relies on the same clock: a test can advance_time()
// past a cutoff instead of fabricating old timestamps.
//
// Internal storage:
//   std::atomic<int64_t> current_time_ms_, plus an atomic counter of sleeps
//   so tests can assert how often the engine backed off.
//
// Thread model:
//   All operations are atomic. sleep_ms() uses fetch_add so concurrent
//   sleepers never lose an increment.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  // Starts at `start_ms` (0 means "epoch", which is fine for most tests).
  explicit SimulationTimeProvider(std::int64_t start_ms = 0);

  std::int64_t now_ms() const override;

  // Advances the clock by duration_ms and returns immediately.
  void sleep_ms(std::int64_t duration_ms) override;

  // Sets the clock to an absolute value. Monotonicity is the caller's
  // responsibility.
  void advance_time(std::int64_t new_time_ms);

  // Number of sleep_ms() calls with a positive duration.
  std::int64_t sleep_count() const;

  // Sum of all positive durations passed to sleep_ms().
  std::int64_t total_slept_ms() const;

 private:
  std::atomic<std::int64_t> current_time_ms_;
  std::atomic<std::int64_t> sleep_count_{0};
  std::atomic<std::int64_t> total_slept_ms_{0};
};

}  // namespace osr
