#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>

namespace osr {

// -----------------------------------------------------------------------------
// IdLockTable — per-order-id mutual exclusion
// -----------------------------------------------------------------------------
//
// @brief  Serialises operations on the same order id while letting
//         operations on different ids run in parallel.
//
// @details
// A table of currently held ids guarded by one mutex. Waiters block on a
// single condition_variable and re-check their own id on every release.
// An id is erased from the table as soon as its guard is released, so the
// table only ever holds the ids that are in flight right now; it does not
// grow with the history.
//
//   tryAcquire(id) → used by submit (contention is a BusyError) and by the
//                    retention sweeper (contention means "skip this record").
//   acquire(id)    → used by cancel and refresh, which wait for an in-flight
//                    submit of the same id to settle.
//
// Both hand back a Guard that releases the id in its destructor, so an
// exception anywhere inside the critical section cannot leak a held id.
//
// Thread model:
//   All member functions are safe to call concurrently. The lock is not
//   re-entrant: acquiring an id already held by the calling thread
//   deadlocks (acquire) or fails (tryAcquire).
//
// Ownership:
//   Owned by OrderService and shared by reference between the lifecycle
//   engine and the retention sweeper. Must outlive every Guard.
// -----------------------------------------------------------------------------
class IdLockTable {
 public:
  // ---------------------------------------------------------------------------
  // Guard: RAII ownership of one held id
  // ---------------------------------------------------------------------------
  // Move-only. A moved-from guard releases nothing.
  // ---------------------------------------------------------------------------
  class Guard {
   public:
    Guard(Guard&& other) noexcept;
    Guard& operator=(Guard&& other) noexcept;
    Guard(const Guard&) = delete;
    Guard& operator=(const Guard&) = delete;
    ~Guard();

    const std::string& id() const { return id_; }

    // Releases early. Safe to call more than once.
    void release();

   private:
    friend class IdLockTable;
    Guard(IdLockTable* table, std::string id);

    IdLockTable* table_;
    std::string id_;
  };

  IdLockTable() = default;

  IdLockTable(const IdLockTable&) = delete;
  IdLockTable& operator=(const IdLockTable&) = delete;
  IdLockTable(IdLockTable&&) = delete;
  IdLockTable& operator=(IdLockTable&&) = delete;

  // Returns std::nullopt without blocking if `id` is held.
  std::optional<Guard> tryAcquire(const std::string& id);

  // Blocks until `id` is free, then takes it.
  Guard acquire(const std::string& id);

  bool isHeld(const std::string& id) const;

  // Number of ids currently held.
  std::size_t size() const;

 private:
  void release(const std::string& id);

  mutable std::mutex mutex_;
  std::condition_variable released_;
  std::unordered_set<std::string> held_;
};

}  // namespace osr
