#pragma once

#include <optional>
#include <unordered_map>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace tending::db::memory {

/*
  Transaction = committed reads + write set

  Every row read or written remembers the version it was based on
  (nullopt = row did not exist). Commit fails if any written row moved
  since, so two transactions racing to insert the same sync id cannot both
  win.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  std::optional<model::InstanceRecord> Read(const std::string& sync_id);
  bool                                 Exists(const std::string& sync_id);
  void                                 Write(const model::InstanceRecord& record);
  std::vector<std::string>             Keys();

 private:
  struct PendingWrite {
    model::InstanceRecord record;
  };

  // Version the transaction observed for a key; nullopt means absent.
  std::optional<uint64_t> Observe(const std::string& sync_id);

  MemoryRepository&                                              repo_;
  std::unordered_map<std::string, std::optional<uint64_t>>       base_versions_;
  std::unordered_map<std::string, PendingWrite>                  writes_;
  bool                                                           committed_   = false;
  bool                                                           rolled_back_ = false;
};

} // namespace tending::db::memory
