#pragma once

#include <google/protobuf/struct.pb.h>

#include <string>
#include <vector>

#include "internal/db/model/instance_record.hpp"
#include "internal/model/instance.hpp"

namespace tending::store {

/*
  Converts between InstanceDocument and its persistent row.

  Each collection is stored as a JSON array of objects:

    tenders     [{"id", "name"}]
    chores      [{"id", "name", "icon"}]
    tending_log [{"id", "timestamp", "person", "chore_id", "notes"?}]

  Timestamps are JSON numbers in unix milliseconds. Anything that does not
  decode throws util::StorageFailure.
*/

google::protobuf::ListValue TendersToList(const std::vector<model::Tender>& tenders);
google::protobuf::ListValue ChoresToList(const std::vector<model::Chore>& chores);
google::protobuf::ListValue HistoryToList(const std::vector<model::HistoryEntry>& entries);

std::string EncodeList(const google::protobuf::ListValue& list);

std::vector<model::Tender>       DecodeTenders(const std::string& json);
std::vector<model::Chore>        DecodeChores(const std::string& json);
std::vector<model::HistoryEntry> DecodeHistory(const std::string& json);

db::model::InstanceRecord ToRecord(const model::InstanceDocument& document);
model::InstanceDocument   FromRecord(const db::model::InstanceRecord& record);

} // namespace tending::store
