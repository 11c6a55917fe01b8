#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace tending::db::postgres {

// A checked-out connection. Dropping the last reference hands it back.
using PooledConnection = std::shared_ptr<pqxx::connection>;

/*
  Bounded set of connections to the instances database.

  Each PgTransaction checks out one connection and holds it until it
  finishes; pqxx connections are never used from two threads at once.
  Acquire blocks while `max_connections` are checked out. New connections
  get the instance statements prepared on open, so the instances table
  must exist before the first Acquire.

  A connection found closed on return is dropped and its slot freed.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 4);

  PooledConnection Acquire();

 private:
  static void      PrepareInstanceStatements(pqxx::connection& conn);
  PooledConnection Lend(std::unique_ptr<pqxx::connection> conn);
  void             Return(pqxx::connection* conn);

  const std::string conninfo_;
  const std::size_t max_connections_;

  std::mutex                                     mutex_;
  std::condition_variable                        returned_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    open_ = 0;
};

} // namespace tending::db::postgres
