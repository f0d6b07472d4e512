#pragma once

#include "osr/domain/order_document.hpp"
#include "osr/domain/order_kind.hpp"
#include "osr/domain/order_status.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace osr {
namespace domain {

// -----------------------------------------------------------------------------
// OrderRecord
// -----------------------------------------------------------------------------
// Responsibility: One submission as persisted in the history log: the
// finalized document that was (or will be) sent, where it stands in the
// lifecycle, and what the OSR knows it as.
//
// @details
// The history store owns the authoritative copy. Every other component works
// on copies returned by IHistoryStore::get/list/update and never writes them
// back directly; changes go through IHistoryStore::update() so they are
// durable before anyone observes them.
//
// Timestamps are epoch milliseconds (UTC). last_updated_at_ms is refreshed on
// every committed change and drives the retention sweep.
//
// Ownership:
// - Created by OrderLifecycleEngine::submit, owned by IHistoryStore,
//   destroyed only by RetentionSweeper.
// -----------------------------------------------------------------------------
struct OrderRecord {
  std::string id;                                // Local id, never reused
  OrderKind kind{OrderKind::Standard};           // Mirrors document.kind()
  OrderDocument document;                        // Finalized snapshot
  OrderStatus status{OrderStatus::Pending};      // Current lifecycle state
  std::int64_t created_at_ms{0};                 // First append
  std::int64_t last_updated_at_ms{0};            // Last committed change
  std::optional<std::string> remote_reference;   // Set once Sent
  int attempts{0};                               // Send attempts so far
  std::optional<std::string> last_error;         // Latest failure reason

  bool operator==(const OrderRecord& other) const {
    return id == other.id && kind == other.kind &&
           document == other.document && status == other.status &&
           created_at_ms == other.created_at_ms &&
           last_updated_at_ms == other.last_updated_at_ms &&
           remote_reference == other.remote_reference &&
           attempts == other.attempts && last_error == other.last_error;
  }
};

}  // namespace domain
}  // namespace osr
