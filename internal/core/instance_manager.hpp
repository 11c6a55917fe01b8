#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/instance.hpp"
#include "internal/store/document_store.hpp"
#include "internal/util/time.hpp"

namespace tending::core {

// Sets last_tended from the first entry (in stored order) holding the
// maximum timestamp; clears it when the log is empty.
void RecomputeLastTended(model::InstanceDocument& document);

/*
  Operations on one instance document.

  Every mutation is load, modify a copy, replace, run under an exclusive
  per-sync-id lock so concurrent requests on the same instance never lose
  updates. Reads take the same lock shared. Different sync ids never
  contend.

  Errors: util::InvalidArgument, util::NotFound, util::StorageFailure.
*/
class InstanceManager {
 public:
  explicit InstanceManager(std::shared_ptr<store::DocumentStore> store, util::MillisClock clock = util::SystemMillisClock());

  // Tenders
  std::vector<model::Tender> ListTenders(const std::string& sync_id);
  model::Tender              AddTender(const std::string& sync_id, const std::string& name);
  model::Tender              RenameTender(const std::string& sync_id, const std::string& tender_id, const std::string& name);
  void                       DeleteTender(const std::string& sync_id, const std::string& tender_id);

  // Chores
  std::vector<model::Chore> ListChores(const std::string& sync_id);
  model::Chore              AddChore(const std::string& sync_id, const std::string& name, const std::string& icon);
  // Applies each field that is present and non-blank after trimming. A blank
  // field is skipped rather than rejected; InvalidArgument only when neither
  // field is usable.
  model::Chore UpdateChore(const std::string& sync_id, const std::string& chore_id, const std::optional<std::string>& name,
                           const std::optional<std::string>& icon);
  void         DeleteChore(const std::string& sync_id, const std::string& chore_id);

  // History
  model::HistoryEntry RecordTending(const std::string& sync_id, const std::string& tender, const std::string& chore_id,
                                    const std::optional<std::string>& notes);
  std::vector<model::HistoryEntry> ListHistory(const std::string& sync_id);
  void                             DeleteHistoryEntry(const std::string& sync_id, const std::string& entry_id);
  model::LastTended                GetLastTended(const std::string& sync_id);

  // Whole-instance transfer
  model::ImportSummary    Import(const std::string& sync_id, const model::ExternalDocument& incoming);
  model::InstanceDocument Export(const std::string& sync_id);

 private:
  std::shared_ptr<std::shared_mutex> InstanceMutex(const std::string& sync_id);

  static void RequireSyncId(const std::string& sync_id);

  std::shared_ptr<store::DocumentStore> store_;
  util::MillisClock                     clock_;

  // One entry per sync id seen by this process; entries are never erased, so
  // the map is bounded by the number of stored documents.
  mutable std::mutex                                                          instance_mutexes_guard_;
  mutable std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> instance_mutexes_;
};

} // namespace tending::core
