#include "memory_tx.hpp"

#include <algorithm>

namespace tending::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

std::optional<uint64_t> MemoryTransaction::Observe(const std::string& sync_id) {
  auto seen = base_versions_.find(sync_id);
  if (seen != base_versions_.end()) return seen->second;

  std::scoped_lock lock(repo_.mutex_);
  std::optional<uint64_t> version;
  auto it = repo_.committed_.find(sync_id);
  if (it != repo_.committed_.end()) version = it->second.version;
  base_versions_.emplace(sync_id, version);
  return version;
}

std::optional<model::InstanceRecord> MemoryTransaction::Read(const std::string& sync_id) {
  auto pending = writes_.find(sync_id);
  if (pending != writes_.end()) return pending->second.record;

  const auto base = Observe(sync_id);
  if (!base.has_value()) return std::nullopt;

  std::scoped_lock lock(repo_.mutex_);
  auto it = repo_.committed_.find(sync_id);
  if (it == repo_.committed_.end()) return std::nullopt;
  return it->second.record;
}

bool MemoryTransaction::Exists(const std::string& sync_id) {
  return writes_.contains(sync_id) || Observe(sync_id).has_value();
}

void MemoryTransaction::Write(const model::InstanceRecord& record) {
  Observe(record.sync_id);
  writes_[record.sync_id] = PendingWrite{record};
}

std::vector<std::string> MemoryTransaction::Keys() {
  std::vector<std::string> keys;
  {
    std::scoped_lock lock(repo_.mutex_);
    keys.reserve(repo_.committed_.size() + writes_.size());
    for (const auto& [sync_id, _] : repo_.committed_) keys.push_back(sync_id);
  }
  for (const auto& [sync_id, _] : writes_) {
    if (std::find(keys.begin(), keys.end(), sync_id) == keys.end()) keys.push_back(sync_id);
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [sync_id, _] : writes_) {
    const auto& base = base_versions_.at(sync_id);
    auto        it   = repo_.committed_.find(sync_id);
    const bool  moved =
        base.has_value() ? (it == repo_.committed_.end() || it->second.version != *base) : (it != repo_.committed_.end());
    if (moved) {
      throw TransactionConflict("transaction conflict: instance '" + sync_id + "' was modified by a concurrent transaction");
    }
  }

  for (auto& [sync_id, pending] : writes_) {
    auto& row   = repo_.committed_[sync_id];
    row.record  = std::move(pending.record);
    row.version = row.version + 1;
  }
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
}

} // namespace tending::db::memory
