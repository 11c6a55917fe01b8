#include "internal/core/merge_import.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/core/instance_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using google::protobuf::Struct;
using tending::core::InstanceManager;
using tending::core::ParseExternalDocument;
using tending::db::memory::MemoryRepository;
using tending::store::DocumentStore;

Struct ParseJson(const std::string& json) {
  Struct out;
  auto   status = google::protobuf::util::JsonStringToMessage(json, &out);
  assert(status.ok());
  return out;
}

std::shared_ptr<InstanceManager> MakeManager() {
  auto repo  = std::make_shared<MemoryRepository>();
  auto store = std::make_shared<DocumentStore>(repo);
  return std::make_shared<InstanceManager>(store);
}

void ExpectInvalid(const std::string& json) {
  bool threw = false;
  try {
    (void)ParseExternalDocument(ParseJson(json));
  } catch (const tending::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

const char* kExport = R"({
  "caretakers": [{"id": "c_1", "name": "Sam"}, {"id": "c_2", "name": "Alex"}],
  "chores": [{"id": "chore_9", "name": "Feed cat", "icon": "🐈"}],
  "tending_log": [
    {"id": "h_1", "timestamp": 1718000000000, "person": "Sam", "chore_id": "chore_9", "notes": null},
    {"id": "h_2", "timestamp": 1718000500000, "person": "Alex", "chore_id": "chore_9", "notes": "extra food"}
  ],
  "last_tended_timestamp": 1718000500000,
  "last_caretaker": "Alex"
})";

void TestParseExportShape() {
  const auto doc = ParseExternalDocument(ParseJson(kExport));
  assert(doc.tenders.size() == 2);
  assert(doc.tenders[1].name == "Alex");
  assert(doc.chores.size() == 1 && doc.chores[0].icon == "🐈");
  assert(doc.tending_log.size() == 2);
  assert(doc.tending_log[0].timestamp_ms == 1718000000000);
  assert(!doc.tending_log[0].notes.has_value());
  assert(doc.tending_log[1].notes == std::optional<std::string>("extra food"));
  assert(doc.last_tended_timestamp_ms == std::optional<int64_t>(1718000500000));
  assert(doc.last_tender == std::optional<std::string>("Alex"));
}

void TestParseAcceptsAliases() {
  const auto doc = ParseExternalDocument(ParseJson(R"({
    "tenders": [{"id": "c_1", "name": "Sam"}],
    "chores": [],
    "tending_log": [{"id": "h_1", "timestamp": 5, "person": "Sam"}],
    "last_tended_timestamp": 5,
    "last_caretaker": "",
    "last_tender": "Sam"
  })"));
  assert(doc.tenders.size() == 1);
  assert(doc.tending_log[0].chore_id.empty());
  assert(doc.last_tender == std::optional<std::string>("Sam"));
}

void TestParseRejectsMalformedPayloads() {
  ExpectInvalid(R"({"chores": [], "tending_log": []})");
  ExpectInvalid(R"({"caretakers": {}, "chores": [], "tending_log": []})");
  ExpectInvalid(R"({"caretakers": [], "tending_log": []})");
  ExpectInvalid(R"({"caretakers": [], "chores": [], "tending_log": "nope"})");
  ExpectInvalid(R"({"caretakers": [{"id": "c_1"}], "chores": [], "tending_log": []})");
  ExpectInvalid(R"({"caretakers": [{"id": 7, "name": "Sam"}], "chores": [], "tending_log": []})");
  ExpectInvalid(R"({"caretakers": ["Sam"], "chores": [], "tending_log": []})");
  ExpectInvalid(R"({"caretakers": [], "chores": [{"id": "chore_1", "name": "Dishes", "icon": ""}], "tending_log": []})");
  ExpectInvalid(R"({"caretakers": [], "chores": [], "tending_log": [{"id": "h_1", "person": "Sam"}]})");
  ExpectInvalid(R"({"caretakers": [], "chores": [], "tending_log": [{"id": "h_1", "timestamp": 0, "person": "Sam"}]})");
  ExpectInvalid(R"({"caretakers": [], "chores": [], "tending_log": [{"id": "h_1", "timestamp": "1", "person": "Sam"}]})");
  ExpectInvalid(R"({"caretakers": [], "chores": [], "tending_log": [{"id": "h_1", "timestamp": 1, "person": ""}]})");
}

void TestInvalidImportLeavesDocumentUntouched() {
  auto manager = MakeManager();
  manager->AddTender("home", "Sam");

  bool threw = false;
  try {
    const auto incoming = ParseExternalDocument(ParseJson(R"({
      "caretakers": [{"id": "c_new", "name": "Alex"}],
      "chores": [],
      "tending_log": [{"id": "h_1", "timestamp": 0, "person": "Alex"}]
    })"));
    manager->Import("home", incoming);
  } catch (const tending::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
  assert(manager->ListTenders("home").size() == 1);
}

const char* kUnrepresentableTimestamps[] = {"1e300", "-1e300", "1.5", "9007199254740993"};

std::string WithEntryTimestamp(const std::string& ts) {
  return R"({"caretakers": [{"id": "c_new", "name": "Alex"}], "chores": [], "tending_log": [{"id": "h_new", "timestamp": )" + ts +
         R"(, "person": "Alex"}]})";
}

std::string WithLastTendedTimestamp(const std::string& ts) {
  return R"({"caretakers": [{"id": "c_new", "name": "Alex"}], "chores": [], "tending_log": [], "last_tended_timestamp": )" + ts +
         R"(, "last_caretaker": "Alex"})";
}

void TestMillisFromJsonNumberBounds() {
  using tending::util::kMaxJsonMillis;
  using tending::util::MillisFromJsonNumber;

  assert(MillisFromJsonNumber(1718000000000.0) == std::optional<int64_t>(1718000000000));
  assert(MillisFromJsonNumber(-5.0) == std::optional<int64_t>(-5));
  assert(MillisFromJsonNumber(static_cast<double>(kMaxJsonMillis)) == std::optional<int64_t>(kMaxJsonMillis));
  assert(MillisFromJsonNumber(-static_cast<double>(kMaxJsonMillis)) == std::optional<int64_t>(-kMaxJsonMillis));
  assert(!MillisFromJsonNumber(9007199254740992.0).has_value());
  assert(!MillisFromJsonNumber(1e300).has_value());
  assert(!MillisFromJsonNumber(-1e300).has_value());
  assert(!MillisFromJsonNumber(1.5).has_value());
  assert(!MillisFromJsonNumber(0.5).has_value());
}

void TestParseRejectsUnrepresentableTimestamps() {
  for (const char* ts : kUnrepresentableTimestamps) {
    ExpectInvalid(WithEntryTimestamp(ts));
    ExpectInvalid(WithLastTendedTimestamp(ts));
  }
}

void TestUnrepresentableTimestampImportLeavesDocumentUntouched() {
  auto manager = MakeManager();
  manager->AddTender("home", "Sam");
  (void)manager->RecordTending("home", "Sam", manager->ListChores("home").front().id, std::nullopt);
  const auto before = tending::core::ToExternalStruct(manager->Export("home"));

  for (const char* ts : kUnrepresentableTimestamps) {
    for (const auto& json : {WithEntryTimestamp(ts), WithLastTendedTimestamp(ts)}) {
      bool threw = false;
      try {
        manager->Import("home", ParseExternalDocument(ParseJson(json)));
      } catch (const tending::util::InvalidArgument&) {
        threw = true;
      }
      assert(threw);

      const auto after = tending::core::ToExternalStruct(manager->Export("home"));
      assert(google::protobuf::util::MessageDifferencer::Equals(before, after));
    }
  }
}

void TestImportIsIdempotent() {
  auto       manager  = MakeManager();
  const auto incoming = ParseExternalDocument(ParseJson(kExport));

  const auto first = manager->Import("home", incoming);
  assert(first.tenders == 2 && first.chores == 1 && first.history_entries == 2);
  const auto after_first = manager->Export("home");

  const auto second = manager->Import("home", incoming);
  assert(second.tenders == 2 && second.chores == 1 && second.history_entries == 2);
  const auto after_second = manager->Export("home");

  assert(after_second.tenders.size() == after_first.tenders.size());
  assert(after_second.chores.size() == after_first.chores.size());
  assert(after_second.tending_log.size() == after_first.tending_log.size());
  assert(after_second.last_tended.timestamp_ms == after_first.last_tended.timestamp_ms);
  assert(after_second.last_tended.tender == after_first.last_tended.tender);

  // Seeded chore plus the imported one.
  assert(after_first.chores.size() == 2);
  assert(manager->GetLastTended("home").tender == std::optional<std::string>("Alex"));
}

// Scenario D: an existing tender id is kept as is.
void TestExistingIdsWinOverImportedRecords() {
  auto manager  = MakeManager();
  auto existing = ParseExternalDocument(ParseJson(R"({
    "caretakers": [{"id": "c_1", "name": "Sam"}],
    "chores": [],
    "tending_log": []
  })"));
  manager->Import("home", existing);

  const auto summary = manager->Import("home", ParseExternalDocument(ParseJson(R"({
    "caretakers": [{"id": "c_1", "name": "Samuel"}, {"id": "c_3", "name": "Kim"}],
    "chores": [],
    "tending_log": []
  })")));
  assert(summary.tenders == 2);

  const auto tenders = manager->ListTenders("home");
  assert(tenders.size() == 2);
  assert(tenders[0].id == "c_1" && tenders[0].name == "Sam");
  assert(tenders[1].id == "c_3" && tenders[1].name == "Kim");
}

void TestDuplicateIdsInsideOneImportAreInsertedOnce() {
  auto       manager = MakeManager();
  const auto summary = manager->Import("home", ParseExternalDocument(ParseJson(R"({
    "caretakers": [{"id": "c_1", "name": "Sam"}, {"id": "c_1", "name": "Again"}],
    "chores": [],
    "tending_log": []
  })")));
  assert(summary.tenders == 2);
  assert(manager->ListTenders("home").size() == 1);
}

void TestOnlyNewerLastTendedIsAdopted() {
  auto manager = MakeManager();
  manager->Import("home", ParseExternalDocument(ParseJson(kExport)));

  // Older declared timestamp: ignored.
  manager->Import("home", ParseExternalDocument(ParseJson(R"({
    "caretakers": [], "chores": [],
    "tending_log": [{"id": "h_old", "timestamp": 1000, "person": "Kim", "chore_id": "chore_9"}],
    "last_tended_timestamp": 1000,
    "last_caretaker": "Kim"
  })")));
  auto last = manager->GetLastTended("home");
  assert(last.timestamp_ms == std::optional<int64_t>(1718000500000));
  assert(last.tender == std::optional<std::string>("Alex"));

  // Equal timestamp: ignored.
  manager->Import("home", ParseExternalDocument(ParseJson(R"({
    "caretakers": [], "chores": [], "tending_log": [],
    "last_tended_timestamp": 1718000500000,
    "last_caretaker": "Kim"
  })")));
  assert(manager->GetLastTended("home").tender == std::optional<std::string>("Alex"));

  // Newer timestamp without a tender clears the tender.
  manager->Import("home", ParseExternalDocument(ParseJson(R"({
    "caretakers": [], "chores": [],
    "tending_log": [{"id": "h_new", "timestamp": 1718009999000, "person": "Kim", "chore_id": "chore_9"}],
    "last_tended_timestamp": 1718009999000
  })")));
  last = manager->GetLastTended("home");
  assert(last.timestamp_ms == std::optional<int64_t>(1718009999000));
  assert(!last.tender.has_value());
}

void TestExportReimportsAsNoop() {
  auto manager = MakeManager();
  manager->AddTender("home", "Sam");
  const auto chore = manager->AddChore("home", "Feed cat", "🐈");
  manager->RecordTending("home", "Sam", chore.id, std::string("fed"));

  const auto exported = tending::core::ToExternalStruct(manager->Export("home"));
  assert(exported.fields().count("caretakers") == 1);
  assert(exported.fields().count("last_caretaker") == 1);
  assert(exported.fields().at("last_caretaker").string_value() == "Sam");

  const auto before = manager->Export("home");
  manager->Import("other", ParseExternalDocument(exported));
  manager->Import("home", ParseExternalDocument(exported));
  const auto after = manager->Export("home");

  assert(after.tenders.size() == before.tenders.size());
  assert(after.chores.size() == before.chores.size());
  assert(after.tending_log.size() == before.tending_log.size());
  assert(after.last_tended.timestamp_ms == before.last_tended.timestamp_ms);

  const auto copied = manager->Export("other");
  assert(copied.tenders.size() == 1);
  assert(copied.tending_log.size() == 1);
  assert(copied.tending_log[0].notes == std::optional<std::string>("fed"));
  assert(copied.last_tended.tender == std::optional<std::string>("Sam"));
}

void TestExportOfFreshInstanceHasNullLastTended() {
  auto       manager  = MakeManager();
  const auto exported = tending::core::ToExternalStruct(manager->Export("fresh"));
  assert(exported.fields().at("last_tended_timestamp").kind_case() == google::protobuf::Value::kNullValue);
  assert(exported.fields().at("last_caretaker").kind_case() == google::protobuf::Value::kNullValue);
  assert(exported.fields().at("chores").list_value().values_size() == 1);
}

} // namespace

int main() {
  TestParseExportShape();
  TestParseAcceptsAliases();
  TestParseRejectsMalformedPayloads();
  TestInvalidImportLeavesDocumentUntouched();
  TestMillisFromJsonNumberBounds();
  TestParseRejectsUnrepresentableTimestamps();
  TestUnrepresentableTimestampImportLeavesDocumentUntouched();
  TestImportIsIdempotent();
  TestExistingIdsWinOverImportedRecords();
  TestDuplicateIdsInsideOneImportAreInsertedOnce();
  TestOnlyNewerLastTendedIsAdopted();
  TestExportReimportsAsNoop();
  TestExportOfFreshInstanceHasNullLastTended();

  std::cout << "tending_manager_unit_merge_import: pass\n";
  return 0;
}
