#include "internal/core/instance_manager.hpp"

#include <algorithm>
#include <atomic>
#include <cassert>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using tending::core::InstanceManager;
using tending::db::memory::MemoryRepository;
using tending::store::DocumentStore;

// Settable clock shared by the store and the manager.
struct TestClock {
  std::shared_ptr<std::atomic<int64_t>> now = std::make_shared<std::atomic<int64_t>>(1700000000000);

  tending::util::MillisClock Fn() const {
    auto state = now;
    return [state] { return state->load(); };
  }

  void Set(int64_t ms) const {
    now->store(ms);
  }
};

struct Fixture {
  TestClock                         clock;
  std::shared_ptr<MemoryRepository> repo  = std::make_shared<MemoryRepository>();
  std::shared_ptr<DocumentStore>    store = std::make_shared<DocumentStore>(repo, clock.Fn());
  InstanceManager                   manager{store, clock.Fn()};
};

template <typename Exception, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Exception&) {
    threw = true;
  }
  assert(threw);
}

// Last-tended must carry the maximum timestamp and the person of an entry
// holding it.
void AssertLastTendedConsistent(InstanceManager& manager, const std::string& sync_id) {
  const auto doc  = manager.Export(sync_id);
  const auto last = manager.GetLastTended(sync_id);
  if (doc.tending_log.empty()) {
    assert(!last.timestamp_ms.has_value());
    assert(!last.tender.has_value());
    return;
  }
  const auto newest = std::max_element(doc.tending_log.begin(), doc.tending_log.end(),
                                       [](const auto& a, const auto& b) { return a.timestamp_ms < b.timestamp_ms; });
  assert(last.timestamp_ms == std::optional<int64_t>(newest->timestamp_ms));
  assert(last.tender.has_value());
  const bool held = std::any_of(doc.tending_log.begin(), doc.tending_log.end(), [&](const auto& entry) {
    return entry.timestamp_ms == newest->timestamp_ms && entry.person == *last.tender;
  });
  assert(held);
}

void TestTenderLifecycle() {
  Fixture f;

  const auto sam = f.manager.AddTender("home", "  Sam  ");
  assert(sam.name == "Sam");
  assert(sam.id.rfind("c_1700000000000_", 0) == 0);

  const auto alex = f.manager.AddTender("home", "Alex");
  const auto dup  = f.manager.AddTender("home", "Sam");
  assert(dup.id != sam.id);

  const auto renamed = f.manager.RenameTender("home", sam.id, " Samantha ");
  assert(renamed.id == sam.id);
  assert(renamed.name == "Samantha");

  auto tenders = f.manager.ListTenders("home");
  assert(tenders.size() == 3);
  assert(tenders[0].id == sam.id && tenders[0].name == "Samantha");
  assert(tenders[1].id == alex.id);

  f.manager.DeleteTender("home", alex.id);
  tenders = f.manager.ListTenders("home");
  assert(tenders.size() == 2);
  assert(tenders[1].id == dup.id);
}

void TestTenderValidation() {
  Fixture f;

  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.AddTender("home", "   "); });
  const auto sam = f.manager.AddTender("home", "Sam");
  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.RenameTender("home", sam.id, ""); });
  ExpectThrows<tending::util::NotFound>([&] { f.manager.RenameTender("home", "c_missing", "Alex"); });
  ExpectThrows<tending::util::NotFound>([&] { f.manager.DeleteTender("home", "c_missing"); });
  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.ListTenders(""); });

  assert(f.manager.ListTenders("home").size() == 1);
}

void TestDeletingTenderKeepsHistory() {
  Fixture f;

  const auto sam   = f.manager.AddTender("home", "Sam");
  const auto chore = f.manager.ListChores("home").front();
  f.manager.RecordTending("home", "Sam", chore.id, std::nullopt);
  f.manager.DeleteTender("home", sam.id);

  const auto history = f.manager.ListHistory("home");
  assert(history.size() == 1);
  assert(history[0].person == "Sam");
  assert(f.manager.GetLastTended("home").tender == std::optional<std::string>("Sam"));
}

void TestChoreLifecycle() {
  Fixture f;

  const auto feed = f.manager.AddChore("home", " Feed the cat ", " 🐈 ");
  assert(feed.name == "Feed the cat");
  assert(feed.icon == "🐈");
  assert(feed.id.rfind("chore_", 0) == 0);

  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.AddChore("home", "Dishes", " "); });
  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.AddChore("home", "", "🍽"); });

  const auto renamed = f.manager.UpdateChore("home", feed.id, std::string("Feed Tom"), std::nullopt);
  assert(renamed.name == "Feed Tom");
  assert(renamed.icon == "🐈");

  // Blank fields are ignored when the other one is usable.
  const auto reiconed = f.manager.UpdateChore("home", feed.id, std::string("  "), std::string("🐱"));
  assert(reiconed.name == "Feed Tom");
  assert(reiconed.icon == "🐱");

  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.UpdateChore("home", feed.id, std::nullopt, std::nullopt); });
  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.UpdateChore("home", feed.id, std::string(""), std::string(" ")); });
  ExpectThrows<tending::util::NotFound>([&] { f.manager.UpdateChore("home", "chore_missing", std::string("x"), std::nullopt); });
  ExpectThrows<tending::util::NotFound>([&] { f.manager.DeleteChore("home", "chore_missing"); });

  const auto chores = f.manager.ListChores("home");
  assert(chores.size() == 2);
  assert(chores[0].name == "Water the plants");
  assert(chores[1].id == feed.id);
}

// Scenario B: add a chore and tend it.
void TestRecordTendingUpdatesLastTended() {
  Fixture f;

  const auto chore = f.manager.AddChore("home", "Feed cat", "🐈");
  f.clock.Set(1700000005000);
  const auto entry = f.manager.RecordTending("home", " Sam ", chore.id, std::string("  "));

  assert(entry.id.rfind("h_1700000005000_", 0) == 0);
  assert(entry.timestamp_ms == 1700000005000);
  assert(entry.person == "Sam");
  assert(entry.chore_id == chore.id);
  assert(!entry.notes.has_value());

  const auto last = f.manager.GetLastTended("home");
  assert(last.timestamp_ms == std::optional<int64_t>(1700000005000));
  assert(last.tender == std::optional<std::string>("Sam"));

  const auto with_notes = f.manager.RecordTending("home", "Alex", chore.id, std::string(" extra food "));
  assert(with_notes.notes == std::optional<std::string>("extra food"));

  // Unknown tenders and chores are accepted.
  f.manager.RecordTending("home", "Visitor", "chore_unknown", std::nullopt);

  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.RecordTending("home", " ", chore.id, std::nullopt); });
  ExpectThrows<tending::util::InvalidArgument>([&] { f.manager.RecordTending("home", "Sam", "", std::nullopt); });

  assert(f.manager.ListHistory("home").size() == 3);
}

void TestHistoryNewestFirstWithStableTies() {
  Fixture f;
  const auto chore = f.manager.ListChores("home").front().id;

  f.clock.Set(1000);
  const auto a = f.manager.RecordTending("home", "A", chore, std::nullopt);
  f.clock.Set(3000);
  const auto b = f.manager.RecordTending("home", "B", chore, std::nullopt);
  f.clock.Set(2000);
  const auto c = f.manager.RecordTending("home", "C", chore, std::nullopt);
  f.clock.Set(3000);
  const auto d = f.manager.RecordTending("home", "D", chore, std::nullopt);

  const auto history = f.manager.ListHistory("home");
  assert(history.size() == 4);
  assert(history[0].id == b.id);
  assert(history[1].id == d.id);
  assert(history[2].id == c.id);
  assert(history[3].id == a.id);

  // Recording always moves last-tended to the newest write, even when its
  // timestamp ties.
  assert(f.manager.GetLastTended("home").tender == std::optional<std::string>("D"));
}

// Scenario C: deleting the newest entry falls back to the next newest.
void TestDeletingNewestEntryRecomputes() {
  Fixture f;
  const auto chore = f.manager.ListChores("home").front().id;

  f.clock.Set(1000);
  const auto first = f.manager.RecordTending("home", "Sam", chore, std::nullopt);
  f.clock.Set(2000);
  const auto second = f.manager.RecordTending("home", "Alex", chore, std::nullopt);

  f.manager.DeleteHistoryEntry("home", second.id);
  auto last = f.manager.GetLastTended("home");
  assert(last.timestamp_ms == std::optional<int64_t>(1000));
  assert(last.tender == std::optional<std::string>("Sam"));

  f.manager.DeleteHistoryEntry("home", first.id);
  last = f.manager.GetLastTended("home");
  assert(!last.timestamp_ms.has_value());
  assert(!last.tender.has_value());

  ExpectThrows<tending::util::NotFound>([&] { f.manager.DeleteHistoryEntry("home", first.id); });
}

void TestDeletingTiedNewestEntryPicksFirstRemainingInStoredOrder() {
  Fixture f;
  const auto chore = f.manager.ListChores("home").front().id;

  f.clock.Set(5000);
  f.manager.RecordTending("home", "A", chore, std::nullopt);
  f.manager.RecordTending("home", "B", chore, std::nullopt);
  const auto c = f.manager.RecordTending("home", "C", chore, std::nullopt);
  assert(f.manager.GetLastTended("home").tender == std::optional<std::string>("C"));

  f.manager.DeleteHistoryEntry("home", c.id);
  assert(f.manager.GetLastTended("home").tender == std::optional<std::string>("A"));
  AssertLastTendedConsistent(f.manager, "home");
}

void TestDeletingOlderEntryKeepsLastTended() {
  Fixture f;
  const auto chore = f.manager.ListChores("home").front().id;

  f.clock.Set(1000);
  const auto old_entry = f.manager.RecordTending("home", "Sam", chore, std::nullopt);
  f.clock.Set(2000);
  f.manager.RecordTending("home", "Alex", chore, std::nullopt);

  f.manager.DeleteHistoryEntry("home", old_entry.id);
  const auto last = f.manager.GetLastTended("home");
  assert(last.timestamp_ms == std::optional<int64_t>(2000));
  assert(last.tender == std::optional<std::string>("Alex"));
}

void TestDeleteChoreCascadesToHistory() {
  Fixture f;
  const auto water = f.manager.ListChores("home").front().id;
  const auto feed  = f.manager.AddChore("home", "Feed cat", "🐈").id;

  f.clock.Set(1000);
  f.manager.RecordTending("home", "Sam", water, std::nullopt);
  f.clock.Set(3000);
  f.manager.RecordTending("home", "Alex", feed, std::nullopt);
  f.clock.Set(2000);
  f.manager.RecordTending("home", "Kim", water, std::nullopt);

  f.manager.DeleteChore("home", feed);

  const auto history = f.manager.ListHistory("home");
  assert(history.size() == 2);
  for (const auto& entry : history) {
    assert(entry.chore_id != feed);
  }
  assert(f.manager.ListChores("home").size() == 1);

  const auto last = f.manager.GetLastTended("home");
  assert(last.timestamp_ms == std::optional<int64_t>(2000));
  assert(last.tender == std::optional<std::string>("Kim"));

  f.manager.DeleteChore("home", water);
  assert(f.manager.ListHistory("home").empty());
  assert(!f.manager.GetLastTended("home").timestamp_ms.has_value());
}

void TestLastTendedInvariantUnderMixedOperations() {
  Fixture f;
  const auto water = f.manager.ListChores("home").front().id;
  const auto feed  = f.manager.AddChore("home", "Feed cat", "🐈").id;

  const int64_t stamps[] = {5000, 1000, 5000, 9000, 3000, 9000, 7000};
  std::vector<std::string> ids;
  for (size_t i = 0; i < std::size(stamps); ++i) {
    f.clock.Set(stamps[i]);
    const auto& chore = (i % 2 == 0) ? water : feed;
    ids.push_back(f.manager.RecordTending("home", "P" + std::to_string(i), chore, std::nullopt).id);
    AssertLastTendedConsistent(f.manager, "home");
  }

  f.manager.DeleteHistoryEntry("home", ids[1]);
  AssertLastTendedConsistent(f.manager, "home");
  f.manager.DeleteHistoryEntry("home", ids[3]);
  AssertLastTendedConsistent(f.manager, "home");
  f.manager.DeleteChore("home", feed);
  AssertLastTendedConsistent(f.manager, "home");
  f.manager.DeleteHistoryEntry("home", ids[6]);
  AssertLastTendedConsistent(f.manager, "home");
}

void TestInstancesAreIsolated() {
  Fixture f;

  f.manager.AddTender("one", "Sam");
  assert(f.manager.ListTenders("one").size() == 1);
  assert(f.manager.ListTenders("two").empty());
  assert(f.manager.ListChores("two").size() == 1);
}

void TestConcurrentWritesOnOneInstanceAreNotLost() {
  auto repo    = std::make_shared<MemoryRepository>();
  auto store   = std::make_shared<DocumentStore>(repo);
  auto manager = std::make_shared<InstanceManager>(store);

  constexpr int kThreads   = 8;
  constexpr int kPerThread = 25;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([manager, t] {
      for (int i = 0; i < kPerThread; ++i) {
        manager->AddTender("shared", "t" + std::to_string(t) + "-" + std::to_string(i));
        manager->AddTender("own-" + std::to_string(t), "x");
      }
    });
  }
  for (auto& thread : threads) thread.join();

  assert(manager->ListTenders("shared").size() == static_cast<size_t>(kThreads * kPerThread));
  for (int t = 0; t < kThreads; ++t) {
    assert(manager->ListTenders("own-" + std::to_string(t)).size() == static_cast<size_t>(kPerThread));
  }
}

} // namespace

int main() {
  TestTenderLifecycle();
  TestTenderValidation();
  TestDeletingTenderKeepsHistory();
  TestChoreLifecycle();
  TestRecordTendingUpdatesLastTended();
  TestHistoryNewestFirstWithStableTies();
  TestDeletingNewestEntryRecomputes();
  TestDeletingTiedNewestEntryPicksFirstRemainingInStoredOrder();
  TestDeletingOlderEntryKeepsLastTended();
  TestDeleteChoreCascadesToHistory();
  TestLastTendedInvariantUnderMixedOperations();
  TestInstancesAreIsolated();
  TestConcurrentWritesOnOneInstanceAreNotLost();

  std::cout << "tending_manager_unit_instance_manager: pass\n";
  return 0;
}
