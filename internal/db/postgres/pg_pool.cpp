#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"

namespace tending::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

PooledConnection PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  returned_.wait(lock, [this] { return !idle_.empty() || open_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  // Reserve the slot, then connect without holding the lock.
  ++open_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareInstanceStatements(*conn);
  } catch (const std::exception& e) {
    {
      std::lock_guard release(mutex_);
      --open_;
    }
    returned_.notify_one();
    TENDING_LOG_ERROR("postgres connect failed", {tending::observability::StringField("error", e.what())});
    throw;
  }
  return Lend(std::move(conn));
}

void PgPool::PrepareInstanceStatements(pqxx::connection& conn) {
  conn.prepare("insert_instance",
               "INSERT INTO instances(sync_id,tenders,chores,tending_log,last_tended_timestamp,last_tender) "
               "VALUES($1,$2,$3,$4,$5,$6)");
  conn.prepare("get_instance",
               "SELECT sync_id,tenders,chores,tending_log,last_tended_timestamp,last_tender "
               "FROM instances WHERE sync_id=$1");
  conn.prepare("update_instance",
               "UPDATE instances SET tenders=$2,chores=$3,tending_log=$4,last_tended_timestamp=$5,last_tender=$6 "
               "WHERE sync_id=$1");
  conn.prepare("list_sync_ids", "SELECT sync_id FROM instances ORDER BY sync_id");
}

PooledConnection PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return PooledConnection(conn.release(), [pool](pqxx::connection* lent) {
    if (auto self = pool.lock()) {
      self->Return(lent);
      return;
    }
    delete lent;
  });
}

void PgPool::Return(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (owned->is_open()) {
      idle_.push_back(std::move(owned));
    } else {
      --open_;
    }
  }
  returned_.notify_one();
}

} // namespace tending::db::postgres
