#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tending::db::model {

/*
  Persistent instance row.

  Collections are opaque JSON array text so that replacing a document is a
  single row write:
    postgres -> text
    sqlite   -> text
    memory   -> string

  The two last-tended columns are kept alongside as plain scalars.
*/

struct InstanceRecord {
  std::string sync_id;

  std::string tenders_json     = "[]";
  std::string chores_json      = "[]";
  std::string tending_log_json = "[]";

  std::optional<int64_t>     last_tended_timestamp_ms;
  std::optional<std::string> last_tender;
};

} // namespace tending::db::model
