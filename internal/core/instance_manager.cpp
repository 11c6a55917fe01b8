#include "instance_manager.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "internal/core/merge_import.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace tending::core {

namespace {

template <typename T>
typename std::vector<T>::iterator FindById(std::vector<T>& items, const std::string& id) {
  return std::find_if(items.begin(), items.end(), [&](const T& item) { return item.id == id; });
}

std::string RequireNonEmpty(const std::string& value, const char* what) {
  auto trimmed = util::Trim(value);
  if (trimmed.empty()) {
    throw util::InvalidArgument(std::string(what) + " is required");
  }
  return trimmed;
}

} // namespace

void RecomputeLastTended(model::InstanceDocument& document) {
  if (document.tending_log.empty()) {
    document.last_tended = model::LastTended{};
    return;
  }

  // max_element returns the first of equal maxima.
  const auto newest = std::max_element(document.tending_log.begin(), document.tending_log.end(),
                                       [](const model::HistoryEntry& a, const model::HistoryEntry& b) { return a.timestamp_ms < b.timestamp_ms; });
  document.last_tended.timestamp_ms = newest->timestamp_ms;
  document.last_tended.tender       = newest->person;
}

InstanceManager::InstanceManager(std::shared_ptr<store::DocumentStore> store, util::MillisClock clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
  if (!store_) {
    throw std::invalid_argument("InstanceManager requires a document store");
  }
  if (!clock_) {
    throw std::invalid_argument("InstanceManager requires a clock");
  }
}

std::shared_ptr<std::shared_mutex> InstanceManager::InstanceMutex(const std::string& sync_id) {
  std::lock_guard lock(instance_mutexes_guard_);
  auto&           mutex = instance_mutexes_[sync_id];
  if (!mutex) {
    mutex = std::make_shared<std::shared_mutex>();
  }
  return mutex;
}

void InstanceManager::RequireSyncId(const std::string& sync_id) {
  if (sync_id.empty()) {
    throw util::InvalidArgument("sync id is required");
  }
}

// ---------------------------------------------------------------------
// Tenders
// ---------------------------------------------------------------------

std::vector<model::Tender> InstanceManager::ListTenders(const std::string& sync_id) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::shared_lock lock(*mutex);
  return store_->GetOrCreate(sync_id).tenders;
}

model::Tender InstanceManager::AddTender(const std::string& sync_id, const std::string& name) {
  RequireSyncId(sync_id);
  const auto trimmed = RequireNonEmpty(name, "tender name");

  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto          document = store_->GetOrCreate(sync_id);
  model::Tender tender{util::GenerateId(util::kTenderIdPrefix, clock_()), trimmed};
  document.tenders.push_back(tender);
  store_->Replace(sync_id, document);
  return tender;
}

model::Tender InstanceManager::RenameTender(const std::string& sync_id, const std::string& tender_id, const std::string& name) {
  RequireSyncId(sync_id);
  const auto trimmed = RequireNonEmpty(name, "tender name");

  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto document = store_->GetOrCreate(sync_id);
  auto it       = FindById(document.tenders, tender_id);
  if (it == document.tenders.end()) {
    throw util::NotFound("tender '" + tender_id + "' not found");
  }
  it->name     = trimmed;
  auto renamed = *it;
  store_->Replace(sync_id, document);
  return renamed;
}

void InstanceManager::DeleteTender(const std::string& sync_id, const std::string& tender_id) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto document = store_->GetOrCreate(sync_id);
  auto it       = FindById(document.tenders, tender_id);
  if (it == document.tenders.end()) {
    throw util::NotFound("tender '" + tender_id + "' not found");
  }
  document.tenders.erase(it);
  store_->Replace(sync_id, document);
}

// ---------------------------------------------------------------------
// Chores
// ---------------------------------------------------------------------

std::vector<model::Chore> InstanceManager::ListChores(const std::string& sync_id) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::shared_lock lock(*mutex);
  return store_->GetOrCreate(sync_id).chores;
}

model::Chore InstanceManager::AddChore(const std::string& sync_id, const std::string& name, const std::string& icon) {
  RequireSyncId(sync_id);
  const auto trimmed_name = RequireNonEmpty(name, "chore name");
  const auto trimmed_icon = RequireNonEmpty(icon, "chore icon");

  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto         document = store_->GetOrCreate(sync_id);
  model::Chore chore{util::GenerateId(util::kChoreIdPrefix, clock_()), trimmed_name, trimmed_icon};
  document.chores.push_back(chore);
  store_->Replace(sync_id, document);
  return chore;
}

model::Chore InstanceManager::UpdateChore(const std::string& sync_id, const std::string& chore_id, const std::optional<std::string>& name,
                                          const std::optional<std::string>& icon) {
  RequireSyncId(sync_id);
  const auto trimmed_name = name.has_value() ? util::Trim(*name) : std::string();
  const auto trimmed_icon = icon.has_value() ? util::Trim(*icon) : std::string();
  if (trimmed_name.empty() && trimmed_icon.empty()) {
    throw util::InvalidArgument("chore name or icon is required");
  }

  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto document = store_->GetOrCreate(sync_id);
  auto it       = FindById(document.chores, chore_id);
  if (it == document.chores.end()) {
    throw util::NotFound("chore '" + chore_id + "' not found");
  }
  if (!trimmed_name.empty()) {
    it->name = trimmed_name;
  }
  if (!trimmed_icon.empty()) {
    it->icon = trimmed_icon;
  }
  auto updated = *it;
  store_->Replace(sync_id, document);
  return updated;
}

void InstanceManager::DeleteChore(const std::string& sync_id, const std::string& chore_id) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto document = store_->GetOrCreate(sync_id);
  auto it       = FindById(document.chores, chore_id);
  if (it == document.chores.end()) {
    throw util::NotFound("chore '" + chore_id + "' not found");
  }
  document.chores.erase(it);

  auto& log = document.tending_log;
  log.erase(std::remove_if(log.begin(), log.end(), [&](const model::HistoryEntry& entry) { return entry.chore_id == chore_id; }), log.end());
  RecomputeLastTended(document);

  store_->Replace(sync_id, document);
}

// ---------------------------------------------------------------------
// History
// ---------------------------------------------------------------------

model::HistoryEntry InstanceManager::RecordTending(const std::string& sync_id, const std::string& tender, const std::string& chore_id,
                                                   const std::optional<std::string>& notes) {
  RequireSyncId(sync_id);
  const auto person  = RequireNonEmpty(tender, "tender");
  const auto chore   = RequireNonEmpty(chore_id, "chore id");
  auto       comment = notes.has_value() ? util::Trim(*notes) : std::string();

  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto       document = store_->GetOrCreate(sync_id);
  const auto now_ms   = clock_();

  model::HistoryEntry entry;
  entry.id           = util::GenerateId(util::kHistoryIdPrefix, now_ms);
  entry.timestamp_ms = now_ms;
  entry.person       = person;
  entry.chore_id     = chore;
  if (!comment.empty()) {
    entry.notes = std::move(comment);
  }

  document.tending_log.push_back(entry);
  document.last_tended.timestamp_ms = entry.timestamp_ms;
  document.last_tended.tender       = entry.person;
  store_->Replace(sync_id, document);
  return entry;
}

std::vector<model::HistoryEntry> InstanceManager::ListHistory(const std::string& sync_id) {
  RequireSyncId(sync_id);
  std::vector<model::HistoryEntry> entries;
  {
    auto             mutex = InstanceMutex(sync_id);
    std::shared_lock lock(*mutex);
    entries = store_->GetOrCreate(sync_id).tending_log;
  }

  std::stable_sort(entries.begin(), entries.end(),
                   [](const model::HistoryEntry& a, const model::HistoryEntry& b) { return a.timestamp_ms > b.timestamp_ms; });
  return entries;
}

void InstanceManager::DeleteHistoryEntry(const std::string& sync_id, const std::string& entry_id) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto document = store_->GetOrCreate(sync_id);
  auto it       = FindById(document.tending_log, entry_id);
  if (it == document.tending_log.end()) {
    throw util::NotFound("history entry '" + entry_id + "' not found");
  }
  const auto removed_ms = it->timestamp_ms;
  document.tending_log.erase(it);

  // An entry strictly older than the cached maximum cannot have been the
  // newest one, so the cache stays valid.
  const auto& cached = document.last_tended.timestamp_ms;
  if (document.tending_log.empty() || !cached.has_value() || removed_ms >= *cached) {
    RecomputeLastTended(document);
  }

  store_->Replace(sync_id, document);
}

model::LastTended InstanceManager::GetLastTended(const std::string& sync_id) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::shared_lock lock(*mutex);
  return store_->GetOrCreate(sync_id).last_tended;
}

// ---------------------------------------------------------------------
// Whole-instance transfer
// ---------------------------------------------------------------------

model::ImportSummary InstanceManager::Import(const std::string& sync_id, const model::ExternalDocument& incoming) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::unique_lock lock(*mutex);

  auto document = store_->GetOrCreate(sync_id);
  auto summary  = MergeInto(document, incoming);
  store_->Replace(sync_id, document);
  return summary;
}

model::InstanceDocument InstanceManager::Export(const std::string& sync_id) {
  RequireSyncId(sync_id);
  auto             mutex = InstanceMutex(sync_id);
  std::shared_lock lock(*mutex);
  return store_->GetOrCreate(sync_id);
}

} // namespace tending::core
