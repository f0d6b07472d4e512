#pragma once

#include "osr/domain/order_record.hpp"
#include "osr/domain/order_status.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace osr {

// -----------------------------------------------------------------------------
// HistoryFilter
// -----------------------------------------------------------------------------
// Selection for IHistoryStore::list(). Empty `statuses` means any status.
// The last_updated_at range is [updated_from_ms, updated_before_ms); either
// bound may be absent.
// -----------------------------------------------------------------------------
struct HistoryFilter {
  std::vector<domain::OrderStatus> statuses;
  std::optional<std::int64_t> updated_from_ms;
  std::optional<std::int64_t> updated_before_ms;

  bool matches(const domain::OrderRecord& record) const;
};

// Read-modify-write step applied by IHistoryStore::update().
using RecordMutator = std::function<void(domain::OrderRecord&)>;

// -----------------------------------------------------------------------------
// IHistoryStore — durable order history
// -----------------------------------------------------------------------------
//
// @brief  Append/update log of OrderRecords keyed by id, kept in insertion
//         order.
//
// @details
// Contract shared by all implementations:
//   - Every mutation is durable before it returns. If it cannot be made
//     durable, it throws StorageError and neither the persistent state nor
//     what readers observe has changed.
//   - Readers never see a partially applied update.
//   - An id is never reused: removing a record retires its id, and append()
//     of a retired id throws DuplicateIdError just like a live one.
//   - Records are returned by value. Callers cannot alias the store's copy.
//
// update() runs the mutator on a copy of the record. If the mutator throws,
// the exception propagates and nothing is written. The record's id cannot be
// changed through a mutator.
//
// Thread model:
//   All members are safe to call concurrently. Serialising operations on
//   the same id is the caller's job (IdLockTable); the store only guarantees
//   each call is atomic.
// -----------------------------------------------------------------------------
class IHistoryStore {
 public:
  virtual ~IHistoryStore() = default;

  // @throws DuplicateIdError, StorageError
  virtual void append(const domain::OrderRecord& record) = 0;

  // @returns the committed record.
  // @throws NotFoundError, StorageError, or whatever the mutator throws.
  virtual domain::OrderRecord update(const std::string& id,
                                     const RecordMutator& mutator) = 0;

  virtual std::optional<domain::OrderRecord> get(const std::string& id) const = 0;

  virtual std::vector<domain::OrderRecord> list(
      const HistoryFilter& filter) const = 0;

  // Removes and retires `id`. Returns false if no such record exists.
  // @throws StorageError
  virtual bool remove(const std::string& id) = 0;

  // Highest N among live and retired ids of the form "<prefix>-N"; 0 if
  // none.
  virtual std::uint64_t maxSequence(const std::string& prefix) const = 0;
};

}  // namespace osr
