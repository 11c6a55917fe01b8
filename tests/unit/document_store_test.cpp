#include "internal/store/document_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/store/document_codec.hpp"
#include "internal/util/errors.hpp"

namespace {

using tending::db::Repository;
using tending::db::Result;
using tending::db::Transaction;
using tending::db::memory::MemoryRepository;
using tending::db::model::InstanceRecord;
using tending::store::DocumentStore;

constexpr int64_t kNowMs = 1700000000000;

tending::util::MillisClock FixedClock() {
  return [] { return kNowMs; };
}

// Lets another writer create the same sync id between our read and our
// insert, once.
class RacingRepository final : public Repository {
 public:
  explicit RacingRepository(std::shared_ptr<MemoryRepository> inner) : inner_(std::move(inner)) {
  }

  std::unique_ptr<Transaction> Begin() override {
    return inner_->Begin();
  }

  Result InsertInstance(Transaction& tx, const InstanceRecord& record) override {
    if (!raced_) {
      raced_ = true;

      auto competitor = DocumentStore::DefaultDocument(record.sync_id, kNowMs - 1);
      competitor.chores.front().name = "Competitor";

      auto other = inner_->Begin();
      assert(inner_->InsertInstance(*other, tending::store::ToRecord(competitor)));
      other->Commit();
    }
    return inner_->InsertInstance(tx, record);
  }

  std::optional<InstanceRecord> GetInstance(Transaction& tx, const std::string& sync_id) override {
    return inner_->GetInstance(tx, sync_id);
  }

  Result UpdateInstance(Transaction& tx, const InstanceRecord& record) override {
    return inner_->UpdateInstance(tx, record);
  }

  std::vector<std::string> ListSyncIds(Transaction& tx) override {
    return inner_->ListSyncIds(tx);
  }

 private:
  std::shared_ptr<MemoryRepository> inner_;
  bool                              raced_ = false;
};

void TestFreshInstanceIsSeededWithDefaultChore() {
  DocumentStore store(std::make_shared<MemoryRepository>(), FixedClock());

  const auto doc = store.GetOrCreate("fresh");
  assert(doc.sync_id == "fresh");
  assert(doc.tenders.empty());
  assert(doc.tending_log.empty());
  assert(doc.chores.size() == 1);
  assert(doc.chores[0].name == "Water the plants");
  assert(doc.chores[0].icon == "🪴");
  assert(doc.chores[0].id.rfind("chore_1700000000000_", 0) == 0);
  assert(!doc.last_tended.timestamp_ms.has_value());
  assert(!doc.last_tended.tender.has_value());

  // Second access reads the persisted document instead of seeding again.
  const auto again = store.GetOrCreate("fresh");
  assert(again.chores.size() == 1);
  assert(again.chores[0].id == doc.chores[0].id);
}

void TestLosingSeedRaceReturnsWinnersDocument() {
  auto          inner = std::make_shared<MemoryRepository>();
  DocumentStore store(std::make_shared<RacingRepository>(inner), FixedClock());

  const auto doc = store.GetOrCreate("contested");
  assert(doc.chores.size() == 1);
  assert(doc.chores[0].name == "Competitor");

  DocumentStore direct(inner, FixedClock());
  assert(direct.GetOrCreate("contested").chores[0].id == doc.chores[0].id);
}

void TestConcurrentFirstAccessConverges() {
  auto repo = std::make_shared<MemoryRepository>();

  for (int round = 0; round < 20; ++round) {
    const auto    sync_id = "race-" + std::to_string(round);
    DocumentStore store(repo);

    std::vector<std::string> seen(4);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
      threads.emplace_back([&, i] { seen[i] = store.GetOrCreate(sync_id).chores.at(0).id; });
    }
    for (auto& t : threads) t.join();

    for (const auto& id : seen) {
      assert(id == seen[0]);
    }
  }
}

void TestReplaceOverwritesWholeDocument() {
  DocumentStore store(std::make_shared<MemoryRepository>(), FixedClock());

  auto doc = store.GetOrCreate("replace");
  doc.tenders.push_back({"c_1_aaaaa", "Sam"});
  doc.chores.clear();
  doc.tending_log.push_back({"h_1_bbbbb", 42, "Sam", "chore_gone", std::string("watered")});
  doc.last_tended.timestamp_ms = 42;
  doc.last_tended.tender       = "Sam";
  store.Replace("replace", doc);

  const auto stored = store.GetOrCreate("replace");
  assert(stored.tenders.size() == 1);
  assert(stored.tenders[0].name == "Sam");
  assert(stored.chores.empty());
  assert(stored.tending_log.size() == 1);
  assert(stored.tending_log[0].notes == std::optional<std::string>("watered"));
  assert(stored.tending_log[0].chore_id == "chore_gone");
  assert(stored.last_tended.timestamp_ms == std::optional<int64_t>(42));
  assert(stored.last_tended.tender == std::optional<std::string>("Sam"));
}

void TestReplaceUnknownSyncIdIsNotFound() {
  DocumentStore store(std::make_shared<MemoryRepository>(), FixedClock());

  bool threw = false;
  try {
    store.Replace("never-created", DocumentStore::DefaultDocument("never-created", kNowMs));
  } catch (const tending::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestUndecodableBlobIsStorageFailure() {
  auto repo = std::make_shared<MemoryRepository>();
  {
    InstanceRecord record;
    record.sync_id      = "corrupt";
    record.tenders_json = "{not json";
    auto tx             = repo->Begin();
    assert(repo->InsertInstance(*tx, record));
    tx->Commit();
  }

  DocumentStore store(repo, FixedClock());

  bool threw = false;
  try {
    (void)store.GetOrCreate("corrupt");
  } catch (const tending::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)store.VerifyAll();
  } catch (const tending::util::StorageFailure&) {
    threw = true;
  }
  assert(threw);
}

void TestUnrepresentableStoredTimestampIsStorageFailure() {
  for (const char* ts : {"1e300", "-1e300", "1.5", "9007199254740993"}) {
    InstanceRecord record;
    record.sync_id          = "bad-ts";
    record.tenders_json     = "[]";
    record.chores_json      = "[]";
    record.tending_log_json = std::string(R"([{"id":"h_1","timestamp":)") + ts + R"(,"person":"Sam","chore_id":"chore_1"}])";

    bool threw = false;
    try {
      (void)tending::store::FromRecord(record);
    } catch (const tending::util::StorageFailure&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestVerifyAllCountsDocuments() {
  DocumentStore store(std::make_shared<MemoryRepository>(), FixedClock());
  assert(store.VerifyAll() == 0);

  (void)store.GetOrCreate("a");
  (void)store.GetOrCreate("b");
  assert(store.VerifyAll() == 2);
}

void TestStoredCollectionsAreJsonArrays() {
  tending::model::InstanceDocument doc;
  doc.sync_id = "blob";
  doc.tenders.push_back({"c_1_aaaaa", "Sam"});
  doc.tending_log.push_back({"h_1_bbbbb", 1718000000000, "Sam", "chore_1_ccccc", std::nullopt});

  const auto record = tending::store::ToRecord(doc);
  assert(record.chores_json == "[]");
  assert(record.tenders_json.front() == '[');
  assert(record.tenders_json.find("\"name\":\"Sam\"") != std::string::npos);
  assert(record.tending_log_json.find("1718000000000") != std::string::npos);
  assert(record.tending_log_json.find("notes") == std::string::npos);

  const auto decoded = tending::store::FromRecord(record);
  assert(decoded.tending_log.size() == 1);
  assert(decoded.tending_log[0].timestamp_ms == 1718000000000);
  assert(!decoded.tending_log[0].notes.has_value());
}

} // namespace

int main() {
  TestFreshInstanceIsSeededWithDefaultChore();
  TestLosingSeedRaceReturnsWinnersDocument();
  TestConcurrentFirstAccessConverges();
  TestReplaceOverwritesWholeDocument();
  TestReplaceUnknownSyncIdIsNotFound();
  TestUndecodableBlobIsStorageFailure();
  TestUnrepresentableStoredTimestampIsStorageFailure();
  TestVerifyAllCountsDocuments();
  TestStoredCollectionsAreJsonArrays();

  std::cout << "tending_manager_unit_document_store: pass\n";
  return 0;
}
