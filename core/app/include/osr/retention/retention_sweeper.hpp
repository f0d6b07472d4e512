#pragma once

#include "osr/concurrent/id_lock_table.hpp"
#include "osr/history/i_history_store.hpp"
#include "osr/time/i_time_provider.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace osr {

// -----------------------------------------------------------------------------
// RetentionSweeper — purge of old history records
// -----------------------------------------------------------------------------
//
// @brief  Removes every record whose last_updated_at is strictly before a
//         cutoff, whatever its status.
//
// @details
// Each candidate's id lock is taken with tryAcquire(). A record that is
// locked belongs to an operation in flight and is skipped; it will be
// considered again by the next sweep. After the lock is taken the record
// is re-read, so a record touched between the listing and the lock is only
// removed if it is still older than the cutoff.
//
// Removed ids are retired by the store and can never be reused.
//
// The sweep is idempotent: running it twice with the same cutoff removes
// nothing the second time.
//
// Thread model:
//   Safe to run concurrently with the lifecycle engine; the two share the
//   IdLockTable.
// -----------------------------------------------------------------------------
class RetentionSweeper {
 public:
  RetentionSweeper(IHistoryStore& history, IdLockTable& locks,
                   const ITimeProvider& clock);

  // Removes records not updated within `older_than` of now. Returns the
  // number removed.
  std::size_t purge(std::chrono::milliseconds older_than);

  // Removes records with last_updated_at < cutoff_ms.
  std::size_t purgeBefore(std::int64_t cutoff_ms);

  // ---------------------------------------------------------------------------
  // cutoffFor(timeframe, now_ms)
  // ---------------------------------------------------------------------------
  // Operator timeframes:
  //   "1d", "1w", "2w"  → now minus 1, 7, 14 days
  //   "1m"              → now minus 30 days
  //   "all"             → everything (cutoff = INT64_MAX)
  //   "YYYY-MM-DD"      → UTC midnight at the start of that date
  // Returns std::nullopt for anything else.
  // ---------------------------------------------------------------------------
  static std::optional<std::int64_t> cutoffFor(const std::string& timeframe,
                                               std::int64_t now_ms);

 private:
  IHistoryStore& history_;
  IdLockTable& locks_;
  const ITimeProvider& clock_;
};

}  // namespace osr
