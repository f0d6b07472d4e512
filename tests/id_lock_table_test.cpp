// =============================================================================
// id_lock_table_test.cpp
// =============================================================================
// Unit tests for osr::IdLockTable and osr::OrderIdGenerator.
//
// Validates:
//   - tryAcquire() is exclusive per id and independent across ids
//   - Guard releases on destruction, on release(), and survives moves
//   - acquire() blocks until the holder releases
//   - OrderIdGenerator: format, advance_past(), unique ids across threads
//
// Design: Each test creates its own table / generator. No global state.
// =============================================================================

#include "osr/concurrent/id_lock_table.hpp"
#include "osr/concurrent/order_id_generator.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

// -----------------------------------------------------------------------------
// 1. Same id: second tryAcquire fails until the first guard goes away.
// -----------------------------------------------------------------------------
TEST(IdLockTableTest, TryAcquireIsExclusivePerId) {
  osr::IdLockTable table;

  {
    auto first = table.tryAcquire("a-1");
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(table.isHeld("a-1"));
    EXPECT_FALSE(table.tryAcquire("a-1").has_value());

    // Other ids are unaffected.
    auto other = table.tryAcquire("a-2");
    EXPECT_TRUE(other.has_value());
    EXPECT_EQ(table.size(), 2u);
  }

  EXPECT_FALSE(table.isHeld("a-1"));
  EXPECT_EQ(table.size(), 0u);
  EXPECT_TRUE(table.tryAcquire("a-1").has_value());
}

// -----------------------------------------------------------------------------
// 2. Explicit release() and moved-from guards release exactly once.
// -----------------------------------------------------------------------------
TEST(IdLockTableTest, GuardReleaseAndMove) {
  osr::IdLockTable table;

  auto guard = table.tryAcquire("a-1");
  ASSERT_TRUE(guard.has_value());
  osr::IdLockTable::Guard moved = std::move(*guard);
  EXPECT_EQ(moved.id(), "a-1");
  EXPECT_TRUE(table.isHeld("a-1"));

  guard.reset();  // moved-from guard must not release
  EXPECT_TRUE(table.isHeld("a-1"));

  moved.release();
  EXPECT_FALSE(table.isHeld("a-1"));
  moved.release();
  EXPECT_FALSE(table.isHeld("a-1"));
}

// -----------------------------------------------------------------------------
// 3. acquire() waits for the holder, then proceeds.
// -----------------------------------------------------------------------------
TEST(IdLockTableTest, AcquireBlocksUntilReleased) {
  osr::IdLockTable table;
  auto held = table.tryAcquire("a-1");
  ASSERT_TRUE(held.has_value());

  std::promise<void> acquired;
  auto acquired_future = acquired.get_future();

  std::thread waiter([&]() {
    auto guard = table.acquire("a-1");
    acquired.set_value();
  });

  EXPECT_EQ(acquired_future.wait_for(std::chrono::milliseconds(50)),
            std::future_status::timeout)
      << "acquire() returned while the id was still held";

  held.reset();

  ASSERT_EQ(acquired_future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready)
      << "Timed out: acquire() never woke up";
  waiter.join();
  EXPECT_FALSE(table.isHeld("a-1"));
}

// -----------------------------------------------------------------------------
// 4. Racing tryAcquire on one id: exactly one winner.
// -----------------------------------------------------------------------------
TEST(IdLockTableTest, ConcurrentTryAcquireHasOneWinner) {
  constexpr int kThreads = 8;
  osr::IdLockTable table;

  std::promise<void> go;
  std::shared_future<void> start = go.get_future().share();
  std::vector<std::future<bool>> results;
  std::vector<std::optional<osr::IdLockTable::Guard>> guards(kThreads);

  for (int i = 0; i < kThreads; ++i) {
    results.push_back(std::async(std::launch::async, [&, i]() {
      start.wait();
      guards[i] = table.tryAcquire("contended");
      return guards[i].has_value();
    }));
  }
  go.set_value();

  int winners = 0;
  for (auto& result : results) {
    winners += result.get() ? 1 : 0;
  }
  EXPECT_EQ(winners, 1);
}

// -----------------------------------------------------------------------------
// 5. OrderIdGenerator: zero-padded format, parse back, advance_past().
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, FormatAndAdvance) {
  osr::OrderIdGenerator gen("osr1");
  EXPECT_EQ(gen.next_id(), "osr1-000001");
  EXPECT_EQ(gen.next_id(), "osr1-000002");

  gen.advance_past(41);
  EXPECT_EQ(gen.next_id(), "osr1-000042");

  // Never moves backwards.
  gen.advance_past(5);
  EXPECT_EQ(gen.next_id(), "osr1-000043");

  EXPECT_EQ(osr::OrderIdGenerator::sequence_of("osr1", "osr1-000043"), 43u);
  EXPECT_FALSE(osr::OrderIdGenerator::sequence_of("osr1", "osr2-000001"));
  EXPECT_FALSE(osr::OrderIdGenerator::sequence_of("osr1", "osr1-12a"));
  EXPECT_FALSE(osr::OrderIdGenerator::sequence_of("osr1", "osr1-"));
}

// -----------------------------------------------------------------------------
// 6. Seeded generator continues after the seed; ids stay unique across
//    threads.
// -----------------------------------------------------------------------------
TEST(OrderIdGeneratorTest, UniqueAcrossThreads) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;
  osr::OrderIdGenerator gen("p", 1000);

  std::mutex mutex;
  std::set<std::string> ids;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&]() {
      for (int i = 0; i < kPerThread; ++i) {
        std::string id = gen.next_id();
        std::lock_guard lock(mutex);
        ids.insert(id);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  EXPECT_EQ(ids.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(*ids.begin(), "p-001001");
}
