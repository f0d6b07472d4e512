#pragma once

#include "osr/domain/order_status.hpp"

namespace osr {

// -----------------------------------------------------------------------------
// OrderStateMachine — legality of OrderStatus transitions
// -----------------------------------------------------------------------------
//
// @brief  Single source of truth for which status changes a record may go
//         through.
//
// @details
//   Pending  → Sent, Failed
//   Sent     → Cancelled, Completed, Failed, Unknown
//   Unknown  → Sent, Completed, Failed, Cancelled
//   Failed, Cancelled, Completed → (terminal, nothing)
//
// Self-transitions are not transitions: the engine rewrites a record
// without changing its status (attempt counter, last_error) without asking
// the state machine.
//
// OrderLifecycleEngine checks isLegal() inside the store's update mutator,
// so the check and the write happen under the same store lock and an
// illegal transition never reaches the file.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  OrderStateMachine() = delete;

  static bool isLegal(domain::OrderStatus current, domain::OrderStatus next);
};

}  // namespace osr
