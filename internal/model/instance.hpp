#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tending::model {

struct Tender {
  std::string id;
  std::string name;
};

struct Chore {
  std::string id;
  std::string name;
  std::string icon;
};

// `person` is a copy of the tender's name when the entry was recorded, never a
// reference to a Tender. `chore_id` may dangle once the chore is gone.
struct HistoryEntry {
  std::string                id;
  int64_t                    timestamp_ms = 0;
  std::string                person;
  std::string                chore_id;
  std::optional<std::string> notes;
};

struct LastTended {
  std::optional<int64_t>     timestamp_ms;
  std::optional<std::string> tender;
};

/*
  One document per sync id.

  Invariant: last_tended is empty iff tending_log is empty, otherwise it
  mirrors the first entry (in stored order) holding the maximum timestamp.
  Merge-import is the one operation allowed to move it forward from outside
  the log.
*/
struct InstanceDocument {
  std::string               sync_id;
  std::vector<Tender>       tenders;
  std::vector<Chore>        chores;
  std::vector<HistoryEntry> tending_log;
  LastTended                last_tended;
};

// Collections in the export naming convention (caretakers, last_caretaker).
struct ExternalDocument {
  std::vector<Tender>        tenders;
  std::vector<Chore>         chores;
  std::vector<HistoryEntry>  tending_log;
  std::optional<int64_t>     last_tended_timestamp_ms;
  std::optional<std::string> last_tender;
};

struct ImportSummary {
  uint64_t tenders         = 0;
  uint64_t chores          = 0;
  uint64_t history_entries = 0;
};

} // namespace tending::model
