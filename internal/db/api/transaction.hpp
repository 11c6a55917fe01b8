#pragma once

#include <stdexcept>
#include <string>

namespace tending::db {

/*
  One unit of work against the instances table.

  Every backend guarantees:

  - writes stay private until Commit()
  - Rollback(), or destruction before Commit(), discards them
  - a read inside the transaction sees the transaction's own writes

  How each gets there:

    SQLite    BEGIN IMMEDIATE, one writer at a time per connection
    Postgres  SERIALIZABLE pqxx transaction on a pooled connection
    Memory    snapshot reads, buffered writes checked at commit
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  // Throws TransactionConflict when another transaction wrote a row this
  // one also wrote, after this one first read it.
  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

}
