#pragma once

#include "osr/time/i_time_provider.hpp"

namespace osr {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
//
// @brief  Reads std::chrono::system_clock and sleeps with
//         std::this_thread::sleep_for.
//
// Thread model:
//   Stateless. Safe to call from any thread without a mutex.
//
// Ownership:
//   Created by main() and passed by reference to OrderService.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;

  void sleep_ms(std::int64_t duration_ms) override;
};

}  // namespace osr
