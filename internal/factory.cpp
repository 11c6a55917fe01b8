#include "factory.hpp"

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/core/instance_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/tending_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/tending_service.hpp"
#include "internal/store/document_store.hpp"
#if TENDING_DB_SQLITE
#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if TENDING_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace tending::factory {

using namespace tending;

namespace {

#if TENDING_DB_SQLITE
std::string ResolveSqlitePath(const tending::runtime::config::SqliteConfig& sqlite) {
  if (const char* path = std::getenv("TENDING_DB_PATH"); path != nullptr && *path != '\0') {
    return path;
  }
  return sqlite.path();
}

std::shared_ptr<db::sqlite::SqliteDB> OpenSqlite(const std::string& path, const db::sqlite::SqliteOptions& options) {
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, options);
  sqlite_db->Probe();
  sqlite_db->Exec(db::sql::CREATE_INSTANCES);
  sqlite_db->Exec("SELECT sync_id,tenders,chores,tending_log,last_tended_timestamp,last_tender FROM instances LIMIT 1;");
  return sqlite_db;
}

std::shared_ptr<db::sqlite::SqliteDB> BootstrapSqlite(const tending::runtime::config::SqliteConfig& sqlite) {
  namespace fs = std::filesystem;

  const auto path = ResolveSqlitePath(sqlite);

  db::sqlite::SqliteOptions options;
  options.wal_mode        = sqlite.wal_mode();
  options.busy_timeout_ms = sqlite.busy_timeout_ms();

  const auto parent = fs::path(path).parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }

  try {
    return OpenSqlite(path, options);
  } catch (const std::exception& e) {
    if (!fs::exists(path)) {
      throw;
    }

    if (!sqlite.recreate_corrupted()) {
      TENDING_LOG_ERROR("SQLite database exists but is unreadable", {observability::StringField("path", path), observability::StringField("error", e.what())});
      TENDING_LOG_ERROR("Recovery: back up the file if it holds data, then remove or rename it and restart",
                        {observability::StringField("path", path)});
      TENDING_LOG_ERROR("Recovery: or set database.sqlite.recreate_corrupted: true to remove it automatically (destroys its data)");
      throw std::runtime_error("sqlite database '" + path + "' is corrupted: " + e.what());
    }

    TENDING_LOG_WARN("Removing corrupted SQLite database", {observability::StringField("path", path), observability::StringField("error", e.what())});
    fs::remove(path);
    fs::remove(path + "-wal");
    fs::remove(path + "-shm");
    return OpenSqlite(path, options);
  }
}
#endif

#if TENDING_DB_POSTGRES
// Runs on its own connection: pooled connections prepare statements against
// the instances table as soon as they open.
void BootstrapPostgresSchema(const std::string& conninfo) {
  pqxx::connection conn(conninfo);
  pqxx::work       tx(conn);

  tx.exec(
      "CREATE TABLE IF NOT EXISTS instances (sync_id TEXT PRIMARY KEY, tenders TEXT NOT NULL DEFAULT '[]', chores TEXT NOT NULL DEFAULT '[]', "
      "tending_log TEXT NOT NULL DEFAULT '[]', last_tended_timestamp BIGINT, last_tender TEXT);");
  tx.exec("SELECT sync_id,tenders,chores,tending_log,last_tended_timestamp,last_tender FROM instances LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const tending::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if TENDING_DB_SQLITE
    auto sqlite_db = BootstrapSqlite(database.sqlite());
    TENDING_LOG_INFO("Using SQLite repository", {observability::StringField("path", sqlite_db->Path()),
                                                 observability::BoolField("wal_mode", database.sqlite().wal_mode()),
                                                 observability::IntField("busy_timeout_ms", sqlite_db->BusyTimeoutMs())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if TENDING_DB_POSTGRES
    BootstrapPostgresSchema(database.postgres().connection_uri());
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    TENDING_LOG_INFO("Using Postgres repository");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  TENDING_LOG_WARN("Using in-memory repository; instances are lost on restart");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const tending::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto repository     = BuildRepository(config);
  auto document_store = std::make_shared<store::DocumentStore>(repository);

  const auto verified = document_store->VerifyAll();
  TENDING_LOG_INFO("Instance documents verified", {observability::IntField("count", static_cast<int64_t>(verified))});

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.manager = std::make_shared<core::InstanceManager>(document_store);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager = app.manager;

  auto tending_service = std::make_shared<service::TendingService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TendingServer>(tending_service));

  return app;
}

} // namespace tending::factory
