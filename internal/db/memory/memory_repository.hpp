#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace tending::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertInstance(Transaction&, const model::InstanceRecord&) override;
  std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string&) override;
  Result UpdateInstance(Transaction&, const model::InstanceRecord&) override;
  std::vector<std::string> ListSyncIds(Transaction&) override;

private:
  friend class MemoryTransaction;

  struct Row {
    model::InstanceRecord record;
    uint64_t              version = 0;
  };

  std::mutex mutex_;
  std::unordered_map<std::string, Row> committed_;
};

}
