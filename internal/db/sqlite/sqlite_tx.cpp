#include "sqlite_tx.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace tending::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), turn_(db_->TransactionMutex(), std::defer_lock) {
  if (!turn_.try_lock_for(std::chrono::milliseconds(db_->BusyTimeoutMs()))) {
    TENDING_LOG_WARN("sqlite transaction wait timed out", {tending::observability::StringField("path", db_->Path()),
                                                           tending::observability::IntField("busy_timeout_ms", db_->BusyTimeoutMs())});
    throw std::runtime_error("sqlite busy: timed out waiting for transaction on " + db_->Path());
  }
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    TENDING_LOG_WARN("sqlite rollback failed", {tending::observability::StringField("path", db_->Path()),
                                                tending::observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) {
    throw std::logic_error("sqlite transaction already finished");
  }
  // On failure the transaction stays open and the destructor rolls it back.
  db_->Exec("COMMIT;");
  Finish(State::kCommitted);
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) return;
  db_->Exec("ROLLBACK;");
  Finish(State::kRolledBack);
}

void SqliteTransaction::Finish(State state) {
  state_ = state;
  turn_.unlock();
}

} // namespace tending::db::sqlite
