#include "osr/history/json_history_store.hpp"
#include "osr/concurrent/order_id_generator.hpp"
#include "osr/domain/errors.hpp"
#include "osr/history/record_codec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iostream>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace osr {

using json = nlohmann::json;
using domain::OrderRecord;

namespace {

constexpr int kFormatVersion = 1;

std::string errnoText(const std::string& what, const std::string& path) {
  return what + " " + path + ": " + std::strerror(errno);
}

std::string parentDirectory(const std::string& path) {
  auto slash = path.find_last_of('/');
  if (slash == std::string::npos) {
    return ".";
  }
  return slash == 0 ? "/" : path.substr(0, slash);
}

// write(2) until the whole buffer is out, retrying on EINTR.
bool writeAll(int fd, const std::string& data) {
  std::size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

// -----------------------------------------------------------------------------
// HistoryFilter
// -----------------------------------------------------------------------------
bool HistoryFilter::matches(const OrderRecord& record) const {
  if (!statuses.empty() &&
      std::find(statuses.begin(), statuses.end(), record.status) ==
          statuses.end()) {
    return false;
  }
  if (updated_from_ms && record.last_updated_at_ms < *updated_from_ms) {
    return false;
  }
  if (updated_before_ms && record.last_updated_at_ms >= *updated_before_ms) {
    return false;
  }
  return true;
}

void JsonHistoryStore::State::reindex() {
  index.clear();
  for (std::size_t i = 0; i < records.size(); ++i) {
    index[records[i].id] = i;
  }
}

// -----------------------------------------------------------------------------
// Constructor: load an existing log, or start empty if there is none
// -----------------------------------------------------------------------------
JsonHistoryStore::JsonHistoryStore(std::string path) : path_(std::move(path)) {
  load();
  std::cout << "[JsonHistoryStore] opened " << path_ << " ("
            << state_.records.size() << " records, " << state_.retired.size()
            << " retired ids)\n";
}

void JsonHistoryStore::load() {
  struct stat info {};
  if (::stat(path_.c_str(), &info) != 0) {
    if (errno == ENOENT) {
      return;
    }
    throw StorageError(errnoText("cannot stat history", path_));
  }
  std::ifstream in(path_);
  if (!in) {
    throw StorageError(errnoText("cannot open history", path_));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw StorageError("cannot read history " + path_);
  }

  try {
    json root = json::parse(buffer.str());
    const int format = root.at("format").get<int>();
    if (format != kFormatVersion) {
      throw StorageError("history " + path_ + " has unsupported format " +
                         std::to_string(format));
    }
    for (const auto& id : root.at("retired_ids")) {
      state_.retired.insert(id.get<std::string>());
    }
    for (const auto& node : root.at("records")) {
      OrderRecord record = recordFromJson(node);
      if (state_.index.count(record.id) != 0) {
        throw StorageError("history " + path_ + " contains id " + record.id +
                           " twice");
      }
      state_.index[record.id] = state_.records.size();
      state_.records.push_back(std::move(record));
    }
  } catch (const json::exception& e) {
    throw StorageError("history " + path_ + " is corrupt: " + e.what());
  }
}

// -----------------------------------------------------------------------------
// persist(): temp file + fsync + rename + directory fsync
// -----------------------------------------------------------------------------
void JsonHistoryStore::persist(const State& next) const {
  json records = json::array();
  for (const auto& record : next.records) {
    records.push_back(recordToJson(record));
  }
  std::vector<std::string> retired(next.retired.begin(), next.retired.end());
  std::sort(retired.begin(), retired.end());

  json root = {{"format", kFormatVersion},
               {"retired_ids", retired},
               {"records", std::move(records)}};
  std::string payload;
  try {
    payload = root.dump(2) + "\n";
  } catch (const json::exception& e) {
    throw StorageError("cannot encode history " + path_ + ": " + e.what());
  }
  const std::string tmp_path = path_ + ".tmp";

  int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  0644);
  if (fd < 0) {
    throw StorageError(errnoText("cannot create", tmp_path));
  }
  if (!writeAll(fd, payload) || ::fsync(fd) != 0) {
    std::string message = errnoText("cannot write", tmp_path);
    ::close(fd);
    ::unlink(tmp_path.c_str());
    std::cerr << "[JsonHistoryStore] ERROR: " << message << "\n";
    throw StorageError(message);
  }
  if (::close(fd) != 0) {
    std::string message = errnoText("cannot close", tmp_path);
    ::unlink(tmp_path.c_str());
    std::cerr << "[JsonHistoryStore] ERROR: " << message << "\n";
    throw StorageError(message);
  }
  if (::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    std::string message = errnoText("cannot rename over", path_);
    ::unlink(tmp_path.c_str());
    std::cerr << "[JsonHistoryStore] ERROR: " << message << "\n";
    throw StorageError(message);
  }

  const std::string dir = parentDirectory(path_);
  int dir_fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dir_fd < 0 || ::fsync(dir_fd) != 0) {
    std::string message = errnoText("cannot sync directory", dir);
    if (dir_fd >= 0) {
      ::close(dir_fd);
    }
    std::cerr << "[JsonHistoryStore] ERROR: " << message << "\n";
    throw StorageError(message);
  }
  ::close(dir_fd);
}

// -----------------------------------------------------------------------------
// Mutations: copy, modify, persist, then commit to memory
// -----------------------------------------------------------------------------
void JsonHistoryStore::append(const OrderRecord& record) {
  std::unique_lock lock(mutex_);
  if (state_.index.count(record.id) != 0 ||
      state_.retired.count(record.id) != 0) {
    throw DuplicateIdError(record.id);
  }
  State next = state_;
  next.index[record.id] = next.records.size();
  next.records.push_back(record);
  persist(next);
  state_ = std::move(next);
}

OrderRecord JsonHistoryStore::update(const std::string& id,
                                     const RecordMutator& mutator) {
  std::unique_lock lock(mutex_);
  auto it = state_.index.find(id);
  if (it == state_.index.end()) {
    throw NotFoundError(id);
  }
  OrderRecord updated = state_.records[it->second];
  mutator(updated);
  updated.id = id;

  State next = state_;
  next.records[it->second] = updated;
  persist(next);
  state_ = std::move(next);
  return updated;
}

bool JsonHistoryStore::remove(const std::string& id) {
  std::unique_lock lock(mutex_);
  auto it = state_.index.find(id);
  if (it == state_.index.end()) {
    return false;
  }
  State next = state_;
  next.records.erase(next.records.begin() +
                     static_cast<std::ptrdiff_t>(it->second));
  next.retired.insert(id);
  next.reindex();
  persist(next);
  state_ = std::move(next);
  return true;
}

// -----------------------------------------------------------------------------
// Reads: shared lock, return copies
// -----------------------------------------------------------------------------
std::optional<OrderRecord> JsonHistoryStore::get(const std::string& id) const {
  std::shared_lock lock(mutex_);
  auto it = state_.index.find(id);
  if (it == state_.index.end()) {
    return std::nullopt;
  }
  return state_.records[it->second];
}

std::vector<OrderRecord> JsonHistoryStore::list(
    const HistoryFilter& filter) const {
  std::shared_lock lock(mutex_);
  std::vector<OrderRecord> result;
  for (const auto& record : state_.records) {
    if (filter.matches(record)) {
      result.push_back(record);
    }
  }
  return result;
}

std::uint64_t JsonHistoryStore::maxSequence(const std::string& prefix) const {
  std::shared_lock lock(mutex_);
  std::uint64_t highest = 0;
  auto consider = [&](const std::string& id) {
    if (auto seq = OrderIdGenerator::sequence_of(prefix, id)) {
      highest = std::max(highest, *seq);
    }
  };
  for (const auto& record : state_.records) {
    consider(record.id);
  }
  for (const auto& id : state_.retired) {
    consider(id);
  }
  return highest;
}

std::size_t JsonHistoryStore::size() const {
  std::shared_lock lock(mutex_);
  return state_.records.size();
}

}  // namespace osr
