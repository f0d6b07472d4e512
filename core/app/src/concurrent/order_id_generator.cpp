#include "osr/concurrent/order_id_generator.hpp"

#include <cctype>
#include <cstdio>
#include <utility>

namespace osr {

OrderIdGenerator::OrderIdGenerator(std::string prefix,
                                   std::uint64_t last_issued)
    : prefix_(std::move(prefix)), last_issued_(last_issued) {}

std::string OrderIdGenerator::next_id() {
  std::uint64_t sequence =
      last_issued_.fetch_add(1, std::memory_order_relaxed) + 1;
  return format(prefix_, sequence);
}

// -----------------------------------------------------------------------------
// advance_past(): CAS loop so a concurrent next_id() is never rolled back
// -----------------------------------------------------------------------------
void OrderIdGenerator::advance_past(std::uint64_t sequence) {
  std::uint64_t current = last_issued_.load(std::memory_order_relaxed);
  while (current < sequence &&
         !last_issued_.compare_exchange_weak(current, sequence,
                                             std::memory_order_relaxed)) {
  }
}

std::string OrderIdGenerator::format(const std::string& prefix,
                                     std::uint64_t sequence) {
  char digits[24];
  std::snprintf(digits, sizeof(digits), "%06llu",
                static_cast<unsigned long long>(sequence));
  return prefix + "-" + digits;
}

std::optional<std::uint64_t> OrderIdGenerator::sequence_of(
    const std::string& prefix, const std::string& id) {
  if (id.size() <= prefix.size() + 1 || id.compare(0, prefix.size(), prefix) != 0 ||
      id[prefix.size()] != '-') {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (std::size_t i = prefix.size() + 1; i < id.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(id[i]))) {
      return std::nullopt;
    }
    value = value * 10 + static_cast<std::uint64_t>(id[i] - '0');
  }
  return value;
}

}  // namespace osr
