#include "pg_repository.hpp"

namespace tending::db::postgres {

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertInstance(Transaction& t, const model::InstanceRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_instance", r.sync_id, r.tenders_json, r.chores_json, r.tending_log_json,
                               r.last_tended_timestamp_ms, r.last_tender);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InstanceRecord> PgRepository::GetInstance(Transaction& t, const std::string& sync_id) {
  auto res = TX(t).Work().exec_prepared("get_instance", sync_id);
  if (res.empty()) return std::nullopt;

  const auto& row = res[0];
  model::InstanceRecord r;
  r.sync_id          = row[0].c_str();
  r.tenders_json     = row[1].c_str();
  r.chores_json      = row[2].c_str();
  r.tending_log_json = row[3].c_str();
  if (!row[4].is_null()) r.last_tended_timestamp_ms = row[4].as<int64_t>();
  if (!row[5].is_null()) r.last_tender = row[5].as<std::string>();
  return r;
}

Result PgRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_instance", r.sync_id, r.tenders_json, r.chores_json, r.tending_log_json,
                                          r.last_tended_timestamp_ms, r.last_tender);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "instance '" + r.sync_id + "' not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListSyncIds(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_sync_ids");

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

} // namespace tending::db::postgres
