#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "tending/manager/services/v1/tending_service.grpc.pb.h"
#include "internal/service/tending_service.hpp"
#include "tending/manager/v1.hpp"

namespace tending::grpc {

class TendingServer final : public tending::manager::v1::TendingService::Service {
public:
  explicit TendingServer(std::shared_ptr<tending::service::TendingService> svc);

  ::grpc::Status ListTenders(::grpc::ServerContext*,
                             const tending::manager::v1::ListTendersRequest*,
                             tending::manager::v1::ListTendersResponse*) override;

  ::grpc::Status AddTender(::grpc::ServerContext*,
                           const tending::manager::v1::AddTenderRequest*,
                           tending::manager::v1::Tender*) override;

  ::grpc::Status RenameTender(::grpc::ServerContext*,
                              const tending::manager::v1::RenameTenderRequest*,
                              tending::manager::v1::Tender*) override;

  ::grpc::Status DeleteTender(::grpc::ServerContext*,
                              const tending::manager::v1::DeleteTenderRequest*,
                              google::protobuf::Empty*) override;

  ::grpc::Status ListChores(::grpc::ServerContext*,
                            const tending::manager::v1::ListChoresRequest*,
                            tending::manager::v1::ListChoresResponse*) override;

  ::grpc::Status AddChore(::grpc::ServerContext*,
                          const tending::manager::v1::AddChoreRequest*,
                          tending::manager::v1::Chore*) override;

  ::grpc::Status UpdateChore(::grpc::ServerContext*,
                             const tending::manager::v1::UpdateChoreRequest*,
                             tending::manager::v1::Chore*) override;

  ::grpc::Status DeleteChore(::grpc::ServerContext*,
                             const tending::manager::v1::DeleteChoreRequest*,
                             google::protobuf::Empty*) override;

  ::grpc::Status RecordTending(::grpc::ServerContext*,
                               const tending::manager::v1::RecordTendingRequest*,
                               tending::manager::v1::HistoryEntry*) override;

  ::grpc::Status ListHistory(::grpc::ServerContext*,
                             const tending::manager::v1::ListHistoryRequest*,
                             tending::manager::v1::ListHistoryResponse*) override;

  ::grpc::Status DeleteHistoryEntry(::grpc::ServerContext*,
                                    const tending::manager::v1::DeleteHistoryEntryRequest*,
                                    google::protobuf::Empty*) override;

  ::grpc::Status GetLastTended(::grpc::ServerContext*,
                               const tending::manager::v1::GetLastTendedRequest*,
                               tending::manager::v1::LastTended*) override;

  ::grpc::Status ImportInstance(::grpc::ServerContext*,
                                const tending::manager::v1::ImportInstanceRequest*,
                                tending::manager::v1::ImportSummary*) override;

  ::grpc::Status ExportInstance(::grpc::ServerContext*,
                                const tending::manager::v1::ExportInstanceRequest*,
                                tending::manager::v1::ExportInstanceResponse*) override;

private:
  std::shared_ptr<tending::service::TendingService> service_;
};

}
