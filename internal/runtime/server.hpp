#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace tending::runtime {

/*
  Serves the tending gRPC services on one listening address.

  Stop() lets in-flight requests drain for up to `drain` before cancelling
  them, so an instance write that already started still reaches the store.
*/
class Server {
public:
  Server(std::string bind_address, std::vector<std::unique_ptr<grpc::Service>> services,
         std::chrono::milliseconds drain = std::chrono::seconds(5));
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Stop();

  // Port actually bound; differs from the address when it asked for port 0.
  int Port() const { return port_; }

private:
  std::string bind_address_;
  std::chrono::milliseconds drain_;
  std::vector<std::unique_ptr<grpc::Service>> services_;
  std::unique_ptr<grpc::Server> grpc_server_;
  int port_ = 0;
};

} // namespace tending::runtime
