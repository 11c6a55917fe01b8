#pragma once

namespace tending::db::sql {

/*
  Canonical SQL used by the SQL backends.

  IMPORTANT:
  These are written in SQLite syntax (? placeholders). The Postgres backend
  prepares its own $n variants of the same statements.
*/

static constexpr const char* CREATE_INSTANCES =
    "CREATE TABLE IF NOT EXISTS instances ("
    " sync_id TEXT PRIMARY KEY,"
    " tenders TEXT NOT NULL DEFAULT '[]',"
    " chores TEXT NOT NULL DEFAULT '[]',"
    " tending_log TEXT NOT NULL DEFAULT '[]',"
    " last_tended_timestamp INTEGER,"
    " last_tender TEXT);";

// Cheap probe that fails on a file that is not a readable database.
static constexpr const char* PROBE_SCHEMA =
    "SELECT name FROM sqlite_master WHERE type='table' LIMIT 1;";

static constexpr const char* INSERT_INSTANCE =
    "INSERT INTO instances(sync_id,tenders,chores,tending_log,last_tended_timestamp,last_tender)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_INSTANCE =
    "SELECT sync_id,tenders,chores,tending_log,last_tended_timestamp,last_tender"
    " FROM instances WHERE sync_id=?;";

static constexpr const char* UPDATE_INSTANCE =
    "UPDATE instances SET tenders=?,chores=?,tending_log=?,last_tended_timestamp=?,last_tender=?"
    " WHERE sync_id=?;";

static constexpr const char* SELECT_SYNC_IDS =
    "SELECT sync_id FROM instances ORDER BY sync_id;";

}
