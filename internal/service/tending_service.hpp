#pragma once

#include "service_context.hpp"
#include "tending/manager/v1.hpp"

namespace tending::service {

class TendingService {
public:
  explicit TendingService(ServiceContext ctx);

  tending::manager::v1::ListTendersResponse ListTenders(const tending::manager::v1::ListTendersRequest& req);
  tending::manager::v1::Tender AddTender(const tending::manager::v1::AddTenderRequest& req);
  tending::manager::v1::Tender RenameTender(const tending::manager::v1::RenameTenderRequest& req);
  void DeleteTender(const tending::manager::v1::DeleteTenderRequest& req);

  tending::manager::v1::ListChoresResponse ListChores(const tending::manager::v1::ListChoresRequest& req);
  tending::manager::v1::Chore AddChore(const tending::manager::v1::AddChoreRequest& req);
  tending::manager::v1::Chore UpdateChore(const tending::manager::v1::UpdateChoreRequest& req);
  void DeleteChore(const tending::manager::v1::DeleteChoreRequest& req);

  tending::manager::v1::HistoryEntry RecordTending(const tending::manager::v1::RecordTendingRequest& req);
  tending::manager::v1::ListHistoryResponse ListHistory(const tending::manager::v1::ListHistoryRequest& req);
  void DeleteHistoryEntry(const tending::manager::v1::DeleteHistoryEntryRequest& req);
  tending::manager::v1::LastTended GetLastTended(const tending::manager::v1::GetLastTendedRequest& req);

  tending::manager::v1::ImportSummary ImportInstance(const tending::manager::v1::ImportInstanceRequest& req);
  tending::manager::v1::ExportInstanceResponse ExportInstance(const tending::manager::v1::ExportInstanceRequest& req);

private:
  ServiceContext ctx_;
};

}
