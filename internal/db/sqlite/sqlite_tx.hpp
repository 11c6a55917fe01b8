#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace tending::db::sqlite {

/*
  BEGIN IMMEDIATE transaction on the shared connection.

  Taking the write lock up front means the read-then-insert in
  DocumentStore::GetOrCreate cannot interleave with another writer of the
  same file. Threads in this process queue on the connection's
  transaction mutex first; Begin throws when the busy timeout passes
  before it is free.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return state_ == State::kCommitted; }

private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void Finish(State state);

  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::timed_mutex> turn_;
  State state_ = State::kOpen;
};

}
