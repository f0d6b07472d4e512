#include "osr/concurrent/id_lock_table.hpp"

#include <utility>

namespace osr {

// -----------------------------------------------------------------------------
// Guard
// -----------------------------------------------------------------------------
IdLockTable::Guard::Guard(IdLockTable* table, std::string id)
    : table_(table), id_(std::move(id)) {}

IdLockTable::Guard::Guard(Guard&& other) noexcept
    : table_(other.table_), id_(std::move(other.id_)) {
  other.table_ = nullptr;
}

IdLockTable::Guard& IdLockTable::Guard::operator=(Guard&& other) noexcept {
  if (this != &other) {
    release();
    table_ = other.table_;
    id_ = std::move(other.id_);
    other.table_ = nullptr;
  }
  return *this;
}

IdLockTable::Guard::~Guard() { release(); }

void IdLockTable::Guard::release() {
  if (table_ != nullptr) {
    table_->release(id_);
    table_ = nullptr;
  }
}

// -----------------------------------------------------------------------------
// tryAcquire(): insert succeeds only if nobody holds the id
// -----------------------------------------------------------------------------
std::optional<IdLockTable::Guard> IdLockTable::tryAcquire(
    const std::string& id) {
  std::lock_guard lock(mutex_);
  if (!held_.insert(id).second) {
    return std::nullopt;
  }
  return Guard(this, id);
}

// -----------------------------------------------------------------------------
// acquire(): wait on the shared condition variable until our id is released
// -----------------------------------------------------------------------------
IdLockTable::Guard IdLockTable::acquire(const std::string& id) {
  std::unique_lock lock(mutex_);
  released_.wait(lock, [&] { return held_.count(id) == 0; });
  held_.insert(id);
  return Guard(this, id);
}

bool IdLockTable::isHeld(const std::string& id) const {
  std::lock_guard lock(mutex_);
  return held_.count(id) != 0;
}

std::size_t IdLockTable::size() const {
  std::lock_guard lock(mutex_);
  return held_.size();
}

void IdLockTable::release(const std::string& id) {
  {
    std::lock_guard lock(mutex_);
    held_.erase(id);
  }
  // Waiters for different ids share the condition variable, so wake them
  // all; each re-checks its own id.
  released_.notify_all();
}

}  // namespace osr
