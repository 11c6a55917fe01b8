#include "merge_import.hpp"

#include <string>
#include <unordered_set>

#include "internal/store/document_codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace tending::core {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

const Value* FindField(const Struct& object, const char* name) {
  auto it = object.fields().find(name);
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

bool IsNullOrAbsent(const Value* value) {
  return value == nullptr || value->kind_case() == Value::kNullValue;
}

const ListValue& RequireArray(const Struct& payload, const char* name, const char* alias = nullptr) {
  const Value* value = FindField(payload, name);
  if (value == nullptr && alias != nullptr) {
    value = FindField(payload, alias);
  }
  if (value == nullptr || value->kind_case() != Value::kListValue) {
    throw util::InvalidArgument(std::string("Invalid import data: '") + name + "' must be an array");
  }
  return value->list_value();
}

std::string Where(const char* collection, int index) {
  return std::string(collection) + "[" + std::to_string(index) + "]";
}

const Struct& RequireObject(const ListValue& list, int index, const char* collection) {
  const auto& value = list.values(index);
  if (value.kind_case() != Value::kStructValue) {
    throw util::InvalidArgument("Invalid import data: " + Where(collection, index) + " must be an object");
  }
  return value.struct_value();
}

std::string RequireString(const Struct& object, const char* field, const char* collection, int index) {
  const Value* value = FindField(object, field);
  if (value == nullptr || value->kind_case() != Value::kStringValue || value->string_value().empty()) {
    throw util::InvalidArgument("Invalid import data: " + Where(collection, index) + "." + field + " must be a non-empty string");
  }
  return value->string_value();
}

std::optional<std::string> OptionalString(const Struct& object, const char* field, const char* collection, int index) {
  const Value* value = FindField(object, field);
  if (IsNullOrAbsent(value)) {
    return std::nullopt;
  }
  if (value->kind_case() != Value::kStringValue) {
    throw util::InvalidArgument("Invalid import data: " + Where(collection, index) + "." + field + " must be a string");
  }
  return value->string_value();
}

int64_t RequireTimestamp(const Struct& object, const char* collection, int index) {
  const Value* value = FindField(object, "timestamp");
  if (value == nullptr || value->kind_case() != Value::kNumberValue) {
    throw util::InvalidArgument("Invalid import data: " + Where(collection, index) + ".timestamp must be a number");
  }
  const auto exact = util::MillisFromJsonNumber(value->number_value());
  if (!exact.has_value()) {
    throw util::InvalidArgument("Invalid import data: " + Where(collection, index) + ".timestamp must be a whole number of milliseconds");
  }
  const int64_t millis = *exact;
  if (millis == 0) {
    throw util::InvalidArgument("Invalid import data: " + Where(collection, index) + ".timestamp must be non-zero");
  }
  return millis;
}

// 0 and null both mean "not declared".
std::optional<int64_t> DeclaredTimestamp(const Struct& payload) {
  const Value* value = FindField(payload, "last_tended_timestamp");
  if (IsNullOrAbsent(value)) {
    return std::nullopt;
  }
  if (value->kind_case() != Value::kNumberValue) {
    throw util::InvalidArgument("Invalid import data: 'last_tended_timestamp' must be a number");
  }
  const auto millis = util::MillisFromJsonNumber(value->number_value());
  if (!millis.has_value()) {
    throw util::InvalidArgument("Invalid import data: 'last_tended_timestamp' must be a whole number of milliseconds");
  }
  if (*millis == 0) {
    return std::nullopt;
  }
  return millis;
}

std::optional<std::string> DeclaredTender(const Struct& payload) {
  for (const char* name : {"last_caretaker", "last_tender"}) {
    const Value* value = FindField(payload, name);
    if (IsNullOrAbsent(value)) {
      continue;
    }
    if (value->kind_case() != Value::kStringValue) {
      throw util::InvalidArgument(std::string("Invalid import data: '") + name + "' must be a string");
    }
    if (!value->string_value().empty()) {
      return value->string_value();
    }
  }
  return std::nullopt;
}

template <typename T>
uint64_t AppendNew(std::vector<T>& existing, const std::vector<T>& incoming) {
  std::unordered_set<std::string> seen;
  seen.reserve(existing.size() + incoming.size());
  for (const auto& item : existing) {
    seen.insert(item.id);
  }

  uint64_t appended = 0;
  for (const auto& item : incoming) {
    if (seen.insert(item.id).second) {
      existing.push_back(item);
      ++appended;
    }
  }
  return appended;
}

Value NullValue() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

} // namespace

model::ExternalDocument ParseExternalDocument(const Struct& payload) {
  const auto& caretakers  = RequireArray(payload, "caretakers", "tenders");
  const auto& tending_log = RequireArray(payload, "tending_log");
  const auto& chores      = RequireArray(payload, "chores");

  model::ExternalDocument document;

  document.tenders.reserve(caretakers.values_size());
  for (int i = 0; i < caretakers.values_size(); ++i) {
    const auto& object = RequireObject(caretakers, i, "caretakers");
    document.tenders.push_back(model::Tender{RequireString(object, "id", "caretakers", i), RequireString(object, "name", "caretakers", i)});
  }

  document.chores.reserve(chores.values_size());
  for (int i = 0; i < chores.values_size(); ++i) {
    const auto& object = RequireObject(chores, i, "chores");
    document.chores.push_back(
        model::Chore{RequireString(object, "id", "chores", i), RequireString(object, "name", "chores", i), RequireString(object, "icon", "chores", i)});
  }

  document.tending_log.reserve(tending_log.values_size());
  for (int i = 0; i < tending_log.values_size(); ++i) {
    const auto&         object = RequireObject(tending_log, i, "tending_log");
    model::HistoryEntry entry;
    entry.id           = RequireString(object, "id", "tending_log", i);
    entry.timestamp_ms = RequireTimestamp(object, "tending_log", i);
    entry.person       = RequireString(object, "person", "tending_log", i);
    entry.chore_id     = OptionalString(object, "chore_id", "tending_log", i).value_or("");
    entry.notes        = OptionalString(object, "notes", "tending_log", i);
    if (entry.notes.has_value() && entry.notes->empty()) {
      entry.notes.reset();
    }
    document.tending_log.push_back(std::move(entry));
  }

  document.last_tended_timestamp_ms = DeclaredTimestamp(payload);
  document.last_tender              = DeclaredTender(payload);
  return document;
}

model::ImportSummary MergeInto(model::InstanceDocument& document, const model::ExternalDocument& incoming) {
  AppendNew(document.tenders, incoming.tenders);
  AppendNew(document.chores, incoming.chores);
  AppendNew(document.tending_log, incoming.tending_log);

  const auto& current = document.last_tended.timestamp_ms;
  if (incoming.last_tended_timestamp_ms.has_value() && (!current.has_value() || *incoming.last_tended_timestamp_ms > *current)) {
    document.last_tended.timestamp_ms = incoming.last_tended_timestamp_ms;
    document.last_tended.tender       = incoming.last_tender;
  }

  model::ImportSummary summary;
  summary.tenders         = incoming.tenders.size();
  summary.chores          = incoming.chores.size();
  summary.history_entries = incoming.tending_log.size();
  return summary;
}

Struct ToExternalStruct(const model::InstanceDocument& document) {
  Struct out;
  auto&  fields = *out.mutable_fields();

  *fields["caretakers"].mutable_list_value()  = store::TendersToList(document.tenders);
  *fields["chores"].mutable_list_value()      = store::ChoresToList(document.chores);
  *fields["tending_log"].mutable_list_value() = store::HistoryToList(document.tending_log);

  if (document.last_tended.timestamp_ms.has_value()) {
    fields["last_tended_timestamp"].set_number_value(static_cast<double>(*document.last_tended.timestamp_ms));
  } else {
    fields["last_tended_timestamp"] = NullValue();
  }

  if (document.last_tended.tender.has_value()) {
    fields["last_caretaker"].set_string_value(*document.last_tended.tender);
  } else {
    fields["last_caretaker"] = NullValue();
  }
  return out;
}

} // namespace tending::core
