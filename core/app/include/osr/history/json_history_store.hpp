#pragma once

#include "osr/history/i_history_store.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace osr {

// -----------------------------------------------------------------------------
// JsonHistoryStore — IHistoryStore backed by one JSON file
// -----------------------------------------------------------------------------
//
// @brief  Keeps the whole history in memory and rewrites the file
//         atomically on every mutation.
//
// @details
// File layout:
//
//   {"format": 1,
//    "retired_ids": ["osr1-000001", ...],
//    "records": [ <record>, ... ]}      // insertion order, see record_codec
//
// Write protocol (every append/update/remove):
//   1. Build the would-be state (records + retired ids) as a copy.
//   2. Serialise it to "<path>.tmp", write(2) it fully, fsync(2).
//   3. rename(2) the temp file over <path>.
//   4. fsync(2) the parent directory so the rename itself is durable.
//   5. Only now swap the copy into memory.
// A failure at any step throws StorageError; the temp file is unlinked and
// both the file and the in-memory index keep their previous content.
//
// Open:
//   A missing file is an empty history. An unreadable or undecodable file
//   throws StorageError from the constructor; the store never silently
//   starts empty on top of a corrupt log.
//
// Thread model:
//   std::shared_mutex: readers (get, list, maxSequence) take a shared lock,
//   writers take an exclusive lock for the whole read-modify-write-persist
//   cycle. A reader therefore sees either the old or the new record, never
//   a mix.
//
// Ownership:
//   Owned by OrderService. Holds no references to other components.
// -----------------------------------------------------------------------------
class JsonHistoryStore final : public IHistoryStore {
 public:
  // @throws StorageError if an existing file cannot be read or decoded.
  explicit JsonHistoryStore(std::string path);

  JsonHistoryStore(const JsonHistoryStore&) = delete;
  JsonHistoryStore& operator=(const JsonHistoryStore&) = delete;
  JsonHistoryStore(JsonHistoryStore&&) = delete;
  JsonHistoryStore& operator=(JsonHistoryStore&&) = delete;

  void append(const domain::OrderRecord& record) override;
  domain::OrderRecord update(const std::string& id,
                             const RecordMutator& mutator) override;
  std::optional<domain::OrderRecord> get(const std::string& id) const override;
  std::vector<domain::OrderRecord> list(
      const HistoryFilter& filter) const override;
  bool remove(const std::string& id) override;
  std::uint64_t maxSequence(const std::string& prefix) const override;

  const std::string& path() const { return path_; }

  // Number of live records.
  std::size_t size() const;

 private:
  // Persisted state. Copied as a whole for each mutation so a failed write
  // leaves the current state untouched.
  struct State {
    std::vector<domain::OrderRecord> records;
    std::unordered_map<std::string, std::size_t> index;  // id → records[i]
    std::unordered_set<std::string> retired;

    void reindex();
  };

  void load();

  // Writes `next` durably. Caller holds the exclusive lock.
  void persist(const State& next) const;

  std::string path_;
  mutable std::shared_mutex mutex_;
  State state_;
};

}  // namespace osr
