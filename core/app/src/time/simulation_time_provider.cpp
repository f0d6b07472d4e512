#include "osr/time/simulation_time_provider.hpp"

namespace osr {

SimulationTimeProvider::SimulationTimeProvider(std::int64_t start_ms)
    : current_time_ms_(start_ms) {}

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// sleep_ms(): the simulated clock jumps forward instead of blocking
// -----------------------------------------------------------------------------
void SimulationTimeProvider::sleep_ms(std::int64_t duration_ms) {
  if (duration_ms <= 0) {
    return;
  }
  current_time_ms_.fetch_add(duration_ms);
  sleep_count_.fetch_add(1);
  total_slept_ms_.fetch_add(duration_ms);
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

std::int64_t SimulationTimeProvider::sleep_count() const {
  return sleep_count_.load();
}

std::int64_t SimulationTimeProvider::total_slept_ms() const {
  return total_slept_ms_.load();
}

}  // namespace osr
