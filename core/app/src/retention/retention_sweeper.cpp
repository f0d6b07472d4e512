#include "osr/retention/retention_sweeper.hpp"
#include "osr/time/time_utils.hpp"

#include <iostream>
#include <limits>

namespace osr {

namespace {

constexpr std::int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

}  // namespace

RetentionSweeper::RetentionSweeper(IHistoryStore& history, IdLockTable& locks,
                                   const ITimeProvider& clock)
    : history_(history), locks_(locks), clock_(clock) {}

std::size_t RetentionSweeper::purge(std::chrono::milliseconds older_than) {
  constexpr std::int64_t kMin = std::numeric_limits<std::int64_t>::min();
  constexpr std::int64_t kMax = std::numeric_limits<std::int64_t>::max();
  const std::int64_t now = clock_.now_ms();
  const std::int64_t age = static_cast<std::int64_t>(older_than.count());

  // Saturate now - age instead of overflowing.
  std::int64_t cutoff = 0;
  if (age > 0 && now < kMin + age) {
    cutoff = kMin;
  } else if (age < 0 && now > kMax + age) {
    cutoff = kMax;
  } else {
    cutoff = now - age;
  }
  return purgeBefore(cutoff);
}

// -----------------------------------------------------------------------------
// purgeBefore(): list candidates, then lock-and-recheck each one
// -----------------------------------------------------------------------------
std::size_t RetentionSweeper::purgeBefore(std::int64_t cutoff_ms) {
  HistoryFilter filter;
  filter.updated_before_ms = cutoff_ms;

  std::size_t removed = 0;
  std::size_t skipped = 0;
  for (const auto& candidate : history_.list(filter)) {
    auto guard = locks_.tryAcquire(candidate.id);
    if (!guard) {
      ++skipped;
      continue;
    }
    auto current = history_.get(candidate.id);
    if (!current || !filter.matches(*current)) {
      continue;
    }
    if (history_.remove(candidate.id)) {
      ++removed;
    }
  }

  std::cout << "[RetentionSweeper] removed " << removed
            << " records updated before "
            << (cutoff_ms == std::numeric_limits<std::int64_t>::max()
                    ? std::string("now (all)")
                    : format_iso8601_ms(cutoff_ms));
  if (skipped > 0) {
    std::cout << ", skipped " << skipped << " in flight";
  }
  std::cout << "\n";
  return removed;
}

std::optional<std::int64_t> RetentionSweeper::cutoffFor(
    const std::string& timeframe, std::int64_t now_ms) {
  if (timeframe == "1d") return now_ms - kMillisPerDay;
  if (timeframe == "1w") return now_ms - 7 * kMillisPerDay;
  if (timeframe == "2w") return now_ms - 14 * kMillisPerDay;
  if (timeframe == "1m") return now_ms - 30 * kMillisPerDay;
  if (timeframe == "all") return std::numeric_limits<std::int64_t>::max();
  return parse_date_utc(timeframe);
}

}  // namespace osr
