#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace tending::db::postgres {

using SerializableWork = pqxx::transaction<pqxx::isolation_level::serializable>;

/*
  SERIALIZABLE transaction on a pooled connection.

  Two writers racing on one sync id surface either as a unique violation
  on insert, a serialization failure on update, or a TransactionConflict
  from Commit. The connection goes back to the pool when this object dies.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction();

  SerializableWork& Work() { return *work_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  PooledConnection conn_;
  std::unique_ptr<SerializableWork> work_;
  bool committed_ = false;
  bool finished_  = false;
};

}
