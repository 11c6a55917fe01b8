#include "tending_server.hpp"
#include "grpc_error.hpp"
#include "tending/manager/v1.hpp"

namespace tending::grpc {

TendingServer::TendingServer(std::shared_ptr<tending::service::TendingService> svc)
    : service_(std::move(svc)) {}

::grpc::Status TendingServer::ListTenders(::grpc::ServerContext*,
                                          const tending::manager::v1::ListTendersRequest* req,
                                          tending::manager::v1::ListTendersResponse* resp) {
  try {
    *resp = service_->ListTenders(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::AddTender(::grpc::ServerContext*,
                                        const tending::manager::v1::AddTenderRequest* req,
                                        tending::manager::v1::Tender* resp) {
  try {
    *resp = service_->AddTender(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::RenameTender(::grpc::ServerContext*,
                                           const tending::manager::v1::RenameTenderRequest* req,
                                           tending::manager::v1::Tender* resp) {
  try {
    *resp = service_->RenameTender(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::DeleteTender(::grpc::ServerContext*,
                                           const tending::manager::v1::DeleteTenderRequest* req,
                                           google::protobuf::Empty*) {
  try {
    service_->DeleteTender(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::ListChores(::grpc::ServerContext*,
                                         const tending::manager::v1::ListChoresRequest* req,
                                         tending::manager::v1::ListChoresResponse* resp) {
  try {
    *resp = service_->ListChores(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::AddChore(::grpc::ServerContext*,
                                       const tending::manager::v1::AddChoreRequest* req,
                                       tending::manager::v1::Chore* resp) {
  try {
    *resp = service_->AddChore(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::UpdateChore(::grpc::ServerContext*,
                                          const tending::manager::v1::UpdateChoreRequest* req,
                                          tending::manager::v1::Chore* resp) {
  try {
    *resp = service_->UpdateChore(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::DeleteChore(::grpc::ServerContext*,
                                          const tending::manager::v1::DeleteChoreRequest* req,
                                          google::protobuf::Empty*) {
  try {
    service_->DeleteChore(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::RecordTending(::grpc::ServerContext*,
                                            const tending::manager::v1::RecordTendingRequest* req,
                                            tending::manager::v1::HistoryEntry* resp) {
  try {
    *resp = service_->RecordTending(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::ListHistory(::grpc::ServerContext*,
                                          const tending::manager::v1::ListHistoryRequest* req,
                                          tending::manager::v1::ListHistoryResponse* resp) {
  try {
    *resp = service_->ListHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::DeleteHistoryEntry(::grpc::ServerContext*,
                                                 const tending::manager::v1::DeleteHistoryEntryRequest* req,
                                                 google::protobuf::Empty*) {
  try {
    service_->DeleteHistoryEntry(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::GetLastTended(::grpc::ServerContext*,
                                            const tending::manager::v1::GetLastTendedRequest* req,
                                            tending::manager::v1::LastTended* resp) {
  try {
    *resp = service_->GetLastTended(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::ImportInstance(::grpc::ServerContext*,
                                             const tending::manager::v1::ImportInstanceRequest* req,
                                             tending::manager::v1::ImportSummary* resp) {
  try {
    *resp = service_->ImportInstance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TendingServer::ExportInstance(::grpc::ServerContext*,
                                             const tending::manager::v1::ExportInstanceRequest* req,
                                             tending::manager::v1::ExportInstanceResponse* resp) {
  try {
    *resp = service_->ExportInstance(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
