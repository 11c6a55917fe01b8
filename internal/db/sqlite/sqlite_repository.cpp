#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace tending::db::sqlite {

using tending::db::ErrorCode;
using tending::db::Result;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
    if (s.has_value()) {
        BindText(st, idx, *s);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

void BindOptionalI64(sqlite3_stmt* st, int idx, const std::optional<int64_t>& v) {
    if (v.has_value()) {
        sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColText(st, col);
}

std::optional<int64_t> ColOptionalI64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

// Owns one prepared statement for the duration of a call.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
            st_ = nullptr;
        }
    }
    ~Statement() { sqlite3_finalize(st_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt* get() const { return st_; }
    explicit operator bool() const { return st_ != nullptr; }

private:
    sqlite3_stmt* st_ = nullptr;
};

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result SqliteRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::INSERT_INSTANCE);
    if (!st) return Translate(db, sqlite3_errcode(db));

    BindText(st.get(), 1, r.sync_id);
    BindText(st.get(), 2, r.tenders_json);
    BindText(st.get(), 3, r.chores_json);
    BindText(st.get(), 4, r.tending_log_json);
    BindOptionalI64(st.get(), 5, r.last_tended_timestamp_ms);
    BindOptionalText(st.get(), 6, r.last_tender);

    return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::InstanceRecord>
SqliteRepository::GetInstance(Transaction& t, const std::string& sync_id) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_INSTANCE);
    if (!st)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    BindText(st.get(), 1, sync_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite select instance: ") + sqlite3_errmsg(db));

    model::InstanceRecord r;
    r.sync_id                  = ColText(st.get(), 0);
    r.tenders_json             = ColText(st.get(), 1);
    r.chores_json              = ColText(st.get(), 2);
    r.tending_log_json         = ColText(st.get(), 3);
    r.last_tended_timestamp_ms = ColOptionalI64(st.get(), 4);
    r.last_tender              = ColOptionalText(st.get(), 5);
    return r;
}

Result SqliteRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::UPDATE_INSTANCE);
    if (!st) return Translate(db, sqlite3_errcode(db));

    BindText(st.get(), 1, r.tenders_json);
    BindText(st.get(), 2, r.chores_json);
    BindText(st.get(), 3, r.tending_log_json);
    BindOptionalI64(st.get(), 4, r.last_tended_timestamp_ms);
    BindOptionalText(st.get(), 5, r.last_tender);
    BindText(st.get(), 6, r.sync_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;

    if (sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "instance '" + r.sync_id + "' not found");
    return Result::Ok();
}

std::vector<std::string> SqliteRepository::ListSyncIds(Transaction& t) {
    auto* db = TX(t).Handle();

    Statement st(db, sql::SELECT_SYNC_IDS);
    if (!st)
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));

    std::vector<std::string> out;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
        out.push_back(ColText(st.get(), 0));
    }
    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite list instances: ") + sqlite3_errmsg(db));
    return out;
}

} // namespace tending::db::sqlite
