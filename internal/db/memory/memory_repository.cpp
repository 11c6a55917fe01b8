#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace tending::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  auto& tx = TX(t);
  if (tx.Exists(r.sync_id)) return Result::Err(ErrorCode::AlreadyExists, "instance '" + r.sync_id + "' already exists");
  tx.Write(r);
  return Result::Ok();
}

std::optional<model::InstanceRecord> MemoryRepository::GetInstance(Transaction& t, const std::string& sync_id) {
  return TX(t).Read(sync_id);
}

Result MemoryRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  auto& tx = TX(t);
  if (!tx.Exists(r.sync_id)) return Result::Err(ErrorCode::NotFound, "instance '" + r.sync_id + "' not found");
  tx.Write(r);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListSyncIds(Transaction& t) {
  return TX(t).Keys();
}

} // namespace tending::db::memory
