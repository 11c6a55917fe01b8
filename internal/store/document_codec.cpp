#include "document_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tending::store {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

Value StringValue(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value NumberValue(int64_t n) {
  Value v;
  v.set_number_value(static_cast<double>(n));
  return v;
}

ListValue ParseList(const std::string& json, const char* column) {
  ListValue list;
  auto      status = google::protobuf::util::JsonStringToMessage(json, &list);
  if (!status.ok()) {
    throw util::StorageFailure(std::string("decode ") + column + ": " + std::string(status.message()));
  }
  return list;
}

const Struct& ObjectAt(const ListValue& list, int i, const char* column) {
  const auto& value = list.values(i);
  if (value.kind_case() != Value::kStructValue) {
    throw util::StorageFailure(std::string("decode ") + column + ": element " + std::to_string(i) + " is not an object");
  }
  return value.struct_value();
}

std::string RequireString(const Struct& object, const char* field, const char* column) {
  auto it = object.fields().find(field);
  if (it == object.fields().end() || it->second.kind_case() != Value::kStringValue) {
    throw util::StorageFailure(std::string("decode ") + column + ": field '" + field + "' missing or not a string");
  }
  return it->second.string_value();
}

// Absent and null both read as empty.
std::optional<std::string> OptionalString(const Struct& object, const char* field, const char* column) {
  auto it = object.fields().find(field);
  if (it == object.fields().end() || it->second.kind_case() == Value::kNullValue) {
    return std::nullopt;
  }
  if (it->second.kind_case() != Value::kStringValue) {
    throw util::StorageFailure(std::string("decode ") + column + ": field '" + field + "' is not a string");
  }
  return it->second.string_value();
}

int64_t RequireMillis(const Struct& object, const char* field, const char* column) {
  auto it = object.fields().find(field);
  if (it == object.fields().end() || it->second.kind_case() != Value::kNumberValue) {
    throw util::StorageFailure(std::string("decode ") + column + ": field '" + field + "' missing or not a number");
  }
  const auto millis = util::MillisFromJsonNumber(it->second.number_value());
  if (!millis.has_value()) {
    throw util::StorageFailure(std::string("decode ") + column + ": field '" + field + "' is not a whole number of milliseconds");
  }
  return *millis;
}

} // namespace

ListValue TendersToList(const std::vector<model::Tender>& tenders) {
  ListValue list;
  for (const auto& tender : tenders) {
    auto& fields   = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["id"]   = StringValue(tender.id);
    fields["name"] = StringValue(tender.name);
  }
  return list;
}

ListValue ChoresToList(const std::vector<model::Chore>& chores) {
  ListValue list;
  for (const auto& chore : chores) {
    auto& fields   = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["id"]   = StringValue(chore.id);
    fields["name"] = StringValue(chore.name);
    fields["icon"] = StringValue(chore.icon);
  }
  return list;
}

ListValue HistoryToList(const std::vector<model::HistoryEntry>& entries) {
  ListValue list;
  for (const auto& entry : entries) {
    auto& fields        = *list.add_values()->mutable_struct_value()->mutable_fields();
    fields["id"]        = StringValue(entry.id);
    fields["timestamp"] = NumberValue(entry.timestamp_ms);
    fields["person"]    = StringValue(entry.person);
    fields["chore_id"]  = StringValue(entry.chore_id);
    if (entry.notes.has_value()) {
      fields["notes"] = StringValue(*entry.notes);
    }
  }
  return list;
}

std::string EncodeList(const ListValue& list) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw util::StorageFailure("encode collection: " + std::string(status.message()));
  }
  return json;
}

std::vector<model::Tender> DecodeTenders(const std::string& json) {
  constexpr const char* kColumn = "tenders";
  const auto            list    = ParseList(json, kColumn);

  std::vector<model::Tender> tenders;
  tenders.reserve(list.values_size());
  for (int i = 0; i < list.values_size(); ++i) {
    const auto& object = ObjectAt(list, i, kColumn);
    tenders.push_back(model::Tender{RequireString(object, "id", kColumn), RequireString(object, "name", kColumn)});
  }
  return tenders;
}

std::vector<model::Chore> DecodeChores(const std::string& json) {
  constexpr const char* kColumn = "chores";
  const auto            list    = ParseList(json, kColumn);

  std::vector<model::Chore> chores;
  chores.reserve(list.values_size());
  for (int i = 0; i < list.values_size(); ++i) {
    const auto& object = ObjectAt(list, i, kColumn);
    chores.push_back(model::Chore{RequireString(object, "id", kColumn), RequireString(object, "name", kColumn), RequireString(object, "icon", kColumn)});
  }
  return chores;
}

std::vector<model::HistoryEntry> DecodeHistory(const std::string& json) {
  constexpr const char* kColumn = "tending_log";
  const auto            list    = ParseList(json, kColumn);

  std::vector<model::HistoryEntry> entries;
  entries.reserve(list.values_size());
  for (int i = 0; i < list.values_size(); ++i) {
    const auto&         object = ObjectAt(list, i, kColumn);
    model::HistoryEntry entry;
    entry.id           = RequireString(object, "id", kColumn);
    entry.timestamp_ms = RequireMillis(object, "timestamp", kColumn);
    entry.person       = RequireString(object, "person", kColumn);
    entry.chore_id     = OptionalString(object, "chore_id", kColumn).value_or("");
    entry.notes        = OptionalString(object, "notes", kColumn);
    entries.push_back(std::move(entry));
  }
  return entries;
}

db::model::InstanceRecord ToRecord(const model::InstanceDocument& document) {
  db::model::InstanceRecord record;
  record.sync_id                  = document.sync_id;
  record.tenders_json             = EncodeList(TendersToList(document.tenders));
  record.chores_json              = EncodeList(ChoresToList(document.chores));
  record.tending_log_json         = EncodeList(HistoryToList(document.tending_log));
  record.last_tended_timestamp_ms = document.last_tended.timestamp_ms;
  record.last_tender              = document.last_tended.tender;
  return record;
}

model::InstanceDocument FromRecord(const db::model::InstanceRecord& record) {
  model::InstanceDocument document;
  document.sync_id                  = record.sync_id;
  document.tenders                  = DecodeTenders(record.tenders_json);
  document.chores                   = DecodeChores(record.chores_json);
  document.tending_log              = DecodeHistory(record.tending_log_json);
  document.last_tended.timestamp_ms = record.last_tended_timestamp_ms;
  document.last_tended.tender       = record.last_tender;
  return document;
}

} // namespace tending::store
