#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace tending::db::sqlite {

struct SqliteOptions {
  bool     wal_mode        = true;
  uint32_t busy_timeout_ms = 5000;
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  uint32_t BusyTimeoutMs() const {
    return options_.busy_timeout_ms;
  }

  // One connection is shared by every thread; transactions on it must not
  // overlap.
  std::timed_mutex& TransactionMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Throws if the file is not a usable database.
  void Probe();

 private:
  void Configure();

  sqlite3*         db_ = nullptr;
  std::string      path_;
  SqliteOptions    options_;
  std::timed_mutex tx_mutex_;
};

} // namespace tending::db::sqlite
