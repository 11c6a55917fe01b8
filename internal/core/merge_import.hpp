#pragma once

#include <google/protobuf/struct.pb.h>

#include "internal/model/instance.hpp"

namespace tending::core {

/*
  Import/export of a whole instance in the external naming convention:

    {
      "caretakers":            [{"id", "name"}],        (alias "tenders")
      "chores":                [{"id", "name", "icon"}],
      "tending_log":           [{"id", "timestamp", "person", "chore_id", "notes"}],
      "last_tended_timestamp": 1718000000000 | null,
      "last_caretaker":        "Sam" | null              (alias "last_tender")
    }
*/

// Validates the whole payload before anything is merged; throws
// util::InvalidArgument naming the first offending field.
model::ExternalDocument ParseExternalDocument(const google::protobuf::Struct& payload);

// Union by id, first write wins. Last-tended moves only when the import
// declares a strictly newer timestamp. The summary counts what was
// presented, not what was inserted.
model::ImportSummary MergeInto(model::InstanceDocument& document, const model::ExternalDocument& incoming);

google::protobuf::Struct ToExternalStruct(const model::InstanceDocument& document);

} // namespace tending::core
