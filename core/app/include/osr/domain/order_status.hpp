#pragma once

#include <optional>
#include <string>

namespace osr {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — persisted lifecycle state of one submission
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an OrderRecord can occupy in the history.
//
// @details
// The legal transition graph is enforced by OrderStateMachine:
//
//   Pending ──> Sent ──────> Cancelled
//      │         │  ├──────> Completed
//      │         │  └──────> Failed
//      │         ▼
//      │      Unknown ──> Sent / Completed / Cancelled / Failed
//      ▼
//    Failed
//
// Terminal states: Failed, Cancelled, Completed.
//
// Unknown is not terminal: it only means the last status check could not
// reach the OSR. The remote reference is kept so a later check can move the
// record back to a definite state.
//
// Thread model:
//   Plain enum, safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Pending,    // Accepted for submission, transport outcome not yet known
  Sent,       // OSR confirmed receipt; remote_reference is set
  Failed,     // Rejected or retries exhausted; terminal state
  Cancelled,  // OSR acknowledged cancellation; terminal state
  Unknown,    // Last status check could not reach the OSR
  Completed,  // OSR reports the order as processed; terminal state
};

const char* toString(OrderStatus status);

std::optional<OrderStatus> parseOrderStatus(const std::string& name);

// True for Failed, Cancelled and Completed.
bool isTerminal(OrderStatus status);

}  // namespace domain
}  // namespace osr
