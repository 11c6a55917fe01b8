#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace tending::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services, std::chrono::milliseconds drain)
    : bind_address_(std::move(bind_address)), drain_(drain), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  if (grpc_server_) {
    throw std::runtime_error("gRPC server already started on " + bind_address_);
  }

  grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, grpc::InsecureServerCredentials(), &port_);
  for (const auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  TENDING_LOG_INFO("gRPC server listening", {tending::observability::StringField("bind_address", bind_address_),
                                             tending::observability::IntField("port", port_),
                                             tending::observability::IntField("services", static_cast<int64_t>(services_.size()))});
}

void Server::Stop() {
  if (!grpc_server_) return;

  TENDING_LOG_INFO("gRPC server draining", {tending::observability::IntField("drain_ms", drain_.count())});
  grpc_server_->Shutdown(std::chrono::system_clock::now() + drain_);
  grpc_server_.reset();
  port_ = 0;
}

} // namespace tending::runtime
