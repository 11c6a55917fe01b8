#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/instance_record.hpp"

namespace tending::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A row is written whole; readers never observe half of an update
  - InsertInstance on an existing sync id fails with AlreadyExists
    (or with a TransactionConflict at commit when the race is only
    visible then)

  The DB is the source of truth for every instance document.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Instances
  // ---------------------------------------------------------------------

  virtual Result InsertInstance(Transaction&, const model::InstanceRecord&) = 0;

  virtual std::optional<model::InstanceRecord> GetInstance(Transaction&, const std::string& sync_id) = 0;

  // NotFound when the sync id was never inserted.
  virtual Result UpdateInstance(Transaction&, const model::InstanceRecord&) = 0;

  virtual std::vector<std::string> ListSyncIds(Transaction&) = 0;
};

} // namespace tending::db
