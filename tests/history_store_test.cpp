// =============================================================================
// history_store_test.cpp
// =============================================================================
// Unit tests for osr::JsonHistoryStore.
//
// Validates:
//   - append/get/list/update/remove round-trip through the file
//   - Ids are never reused: live and retired ids are both duplicates
//   - A failed durable write leaves readers' view unchanged
//   - A throwing mutator writes nothing
//   - Corrupt history files are rejected at open
//   - maxSequence() covers retired ids
//   - Concurrent appends from several threads all land
//
// Design: Each test gets its own temporary directory, removed on TearDown.
// =============================================================================

#include "osr/domain/errors.hpp"
#include "osr/domain/order_record.hpp"
#include "osr/history/json_history_store.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using osr::domain::OrderRecord;
using osr::domain::OrderStatus;

// Helper: a finalized single-element record (decoded documents are
// Finalized, so records must be too to compare equal after a reload).
static OrderRecord makeRecord(const std::string& id, std::int64_t updated_ms,
                              OrderStatus status = OrderStatus::Pending) {
  osr::domain::DocumentElement root{"host2osr", {}, {}};
  root.addChild("pick_order").setAttribute("order_number", "src-pick-" + id);
  osr::domain::OrderDocument document(osr::domain::OrderKind::Standard, root,
                                      false);
  document.finalize();

  OrderRecord record;
  record.id = id;
  record.kind = osr::domain::OrderKind::Standard;
  record.document = document;
  record.status = status;
  record.created_at_ms = updated_ms;
  record.last_updated_at_ms = updated_ms;
  return record;
}

class HistoryStoreTestFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    char pattern[] = "/tmp/osr_history_test_XXXXXX";
    ASSERT_NE(::mkdtemp(pattern), nullptr);
    dir = pattern;
    path = dir + "/history.json";
  }

  void TearDown() override { std::filesystem::remove_all(dir); }

  std::string dir;
  std::string path;
};

// -----------------------------------------------------------------------------
// 1. A missing file opens as an empty store; records survive a reopen.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, PersistsAcrossReopen) {
  OrderRecord first = makeRecord("osr1-000001", 1'700'000'000'000);
  first.remote_reference = "R-1";
  first.attempts = 1;
  first.status = OrderStatus::Sent;
  OrderRecord second = makeRecord("osr1-000002", 1'700'000'001'000);
  second.last_error = "gave up after 3 attempts: timeout";

  {
    osr::JsonHistoryStore store(path);
    EXPECT_EQ(store.size(), 0u);
    store.append(first);
    store.append(second);
  }

  osr::JsonHistoryStore reopened(path);
  ASSERT_EQ(reopened.size(), 2u);
  EXPECT_EQ(*reopened.get("osr1-000001"), first);
  EXPECT_EQ(*reopened.get("osr1-000002"), second);

  // Insertion order is kept.
  auto all = reopened.list({});
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].id, "osr1-000001");
  EXPECT_EQ(all[1].id, "osr1-000002");
}

// -----------------------------------------------------------------------------
// 2. Duplicate ids: live ids and removed (retired) ids are both rejected,
//    also after a reopen.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, IdsAreNeverReused) {
  {
    osr::JsonHistoryStore store(path);
    store.append(makeRecord("a-1", 10));
    EXPECT_THROW(store.append(makeRecord("a-1", 20)), osr::DuplicateIdError);

    EXPECT_TRUE(store.remove("a-1"));
    EXPECT_FALSE(store.remove("a-1"));
    EXPECT_FALSE(store.get("a-1").has_value());
    EXPECT_THROW(store.append(makeRecord("a-1", 30)), osr::DuplicateIdError);
  }

  osr::JsonHistoryStore reopened(path);
  EXPECT_THROW(reopened.append(makeRecord("a-1", 40)), osr::DuplicateIdError);
}

// -----------------------------------------------------------------------------
// 3. update(): mutator result is committed; the id cannot be changed;
//    unknown ids throw NotFoundError.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, UpdateCommitsMutatorResult) {
  osr::JsonHistoryStore store(path);
  store.append(makeRecord("a-1", 10));

  auto committed = store.update("a-1", [](OrderRecord& r) {
    r.status = OrderStatus::Sent;
    r.remote_reference = "R-9";
    r.id = "hijacked";
  });

  EXPECT_EQ(committed.id, "a-1");
  EXPECT_EQ(committed.status, OrderStatus::Sent);
  EXPECT_EQ(store.get("a-1")->remote_reference, "R-9");
  EXPECT_FALSE(store.get("hijacked").has_value());

  EXPECT_THROW(store.update("nope", [](OrderRecord&) {}), osr::NotFoundError);
}

// -----------------------------------------------------------------------------
// 4. A throwing mutator leaves the record untouched.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, ThrowingMutatorWritesNothing) {
  osr::JsonHistoryStore store(path);
  store.append(makeRecord("a-1", 10));

  EXPECT_THROW(store.update("a-1",
                            [](OrderRecord& r) {
                              r.status = OrderStatus::Cancelled;
                              throw std::logic_error("refused");
                            }),
               std::logic_error);

  EXPECT_EQ(store.get("a-1")->status, OrderStatus::Pending);
  osr::JsonHistoryStore reopened(path);
  EXPECT_EQ(reopened.get("a-1")->status, OrderStatus::Pending);
}

// -----------------------------------------------------------------------------
// 5. Durable write failure: StorageError, and readers still see the old
//    state.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, FailedWriteLeavesStateUnchanged) {
  osr::JsonHistoryStore store(dir + "/missing/history.json");

  EXPECT_THROW(store.append(makeRecord("a-1", 10)), osr::StorageError);
  EXPECT_FALSE(store.get("a-1").has_value());
  EXPECT_EQ(store.size(), 0u);
}

// -----------------------------------------------------------------------------
// 6. Corrupt and unsupported files are rejected at open.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, CorruptFileIsRejected) {
  {
    std::ofstream out(path);
    out << "{ this is not json";
  }
  EXPECT_THROW(osr::JsonHistoryStore store(path), osr::StorageError);

  {
    std::ofstream out(path);
    out << R"({"format": 99, "retired_ids": [], "records": []})";
  }
  EXPECT_THROW(osr::JsonHistoryStore store(path), osr::StorageError);

  {
    std::ofstream out(path);
    out << R"({"format": 1, "retired_ids": [], "records": [{"id": "x"}]})";
  }
  EXPECT_THROW(osr::JsonHistoryStore store(path), osr::StorageError);
}

// -----------------------------------------------------------------------------
// 7. list(): status filter and the half-open last_updated range.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, ListFilters) {
  osr::JsonHistoryStore store(path);
  store.append(makeRecord("a-1", 100, OrderStatus::Sent));
  store.append(makeRecord("a-2", 200, OrderStatus::Failed));
  store.append(makeRecord("a-3", 300, OrderStatus::Sent));

  osr::HistoryFilter sent;
  sent.statuses = {OrderStatus::Sent};
  EXPECT_EQ(store.list(sent).size(), 2u);

  osr::HistoryFilter window;
  window.updated_from_ms = 200;
  window.updated_before_ms = 300;
  auto in_window = store.list(window);
  ASSERT_EQ(in_window.size(), 1u);
  EXPECT_EQ(in_window[0].id, "a-2");
}

// -----------------------------------------------------------------------------
// 8. maxSequence(): highest suffix among live and retired ids for a prefix.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, MaxSequenceIncludesRetiredIds) {
  osr::JsonHistoryStore store(path);
  store.append(makeRecord("osr1-000003", 10));
  store.append(makeRecord("osr1-000007", 10));
  store.append(makeRecord("other-000050", 10));
  store.append(makeRecord("manual-id", 10));
  ASSERT_TRUE(store.remove("osr1-000007"));

  EXPECT_EQ(store.maxSequence("osr1"), 7u);
  EXPECT_EQ(store.maxSequence("other"), 50u);
  EXPECT_EQ(store.maxSequence("nobody"), 0u);
}

// -----------------------------------------------------------------------------
// 9. Concurrent appends from several threads: every record lands exactly
//    once and the file reloads with all of them.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, ConcurrentAppends) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 10;

  {
    osr::JsonHistoryStore store(path);
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&store, t]() {
        for (int i = 0; i < kPerThread; ++i) {
          store.append(makeRecord(
              "t" + std::to_string(t) + "-" + std::to_string(i), i));
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
    EXPECT_EQ(store.size(), static_cast<std::size_t>(kThreads * kPerThread));
  }

  osr::JsonHistoryStore reopened(path);
  EXPECT_EQ(reopened.size(), static_cast<std::size_t>(kThreads * kPerThread));
}

// -----------------------------------------------------------------------------
// 10. A record the JSON encoder cannot represent is a StorageError and
//     changes nothing, in memory or on disk.
// -----------------------------------------------------------------------------
TEST_F(HistoryStoreTestFixture, UnencodableRecordIsStorageError) {
  osr::JsonHistoryStore store(path);
  store.append(makeRecord("a-1", 10));

  OrderRecord bad = makeRecord("a-2", 20);
  bad.last_error = std::string("Bad\xff");
  EXPECT_THROW(store.append(bad), osr::StorageError);
  EXPECT_FALSE(store.get("a-2").has_value());
  EXPECT_EQ(store.size(), 1u);

  osr::JsonHistoryStore reopened(path);
  EXPECT_EQ(reopened.size(), 1u);
}
