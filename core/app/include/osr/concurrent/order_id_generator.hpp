#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

namespace osr {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe source of system-assigned order ids
// -----------------------------------------------------------------------------
//
// @brief  Produces "<prefix>-<6-digit sequence>" ids ("osr1-000042") from an
//         atomic counter.
//
// @details
// The lifecycle engine seeds the generator with the highest sequence already
// present in the history (IHistoryStore::maxSequence, which also scans
// retired ids), so a restart never hands out an id that was used before.
// Sequences past 999999 simply grow wider; the zero padding is a minimum.
//
// If an id still collides (an operator picked "osr1-000043" by hand), the
// engine calls next_id() again; the counter only moves forward.
//
// Thread model:
//   next_id() and advance_past() are safe to call concurrently.
//
// Ownership:
//   Owned as a value member by OrderLifecycleEngine.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  explicit OrderIdGenerator(std::string prefix, std::uint64_t last_issued = 0);

  // Non-copyable, non-movable: two generators over the same prefix would
  // hand out duplicate ids.
  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::string next_id();

  // Makes sure the next id issued has a sequence greater than `sequence`.
  void advance_past(std::uint64_t sequence);

  const std::string& prefix() const { return prefix_; }

  // Formats "<prefix>-<sequence padded to 6 digits>".
  static std::string format(const std::string& prefix, std::uint64_t sequence);

  // Extracts the sequence of an id of the form "<prefix>-<digits>".
  static std::optional<std::uint64_t> sequence_of(const std::string& prefix,
                                                  const std::string& id);

 private:
  std::string prefix_;
  std::atomic<std::uint64_t> last_issued_;
};

}  // namespace osr
