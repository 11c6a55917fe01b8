#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"

namespace tending::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()), work_(std::make_unique<SerializableWork>(*conn_)) {
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    work_->abort();
  } catch (const std::exception& e) {
    TENDING_LOG_WARN("postgres rollback failed", {tending::observability::StringField("error", e.what())});
  }
  // The work must go before the connection it runs on returns to the pool.
  work_.reset();
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw TransactionConflict(e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  work_->abort();
}

}
