#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace tending::core {
class InstanceManager;
}

namespace tending::factory {

struct Application {
  std::shared_ptr<tending::core::InstanceManager> manager;
  std::vector<std::unique_ptr<::grpc::Service>>   grpc_services;
};

/*
  Composition root. The only place that knows concrete repository types.

  Opens (and bootstraps) the configured backend, decodes every stored
  instance once, then wires the services. A backend that cannot be opened
  or a document that cannot be decoded fails the build.
*/
Application Build(const tending::runtime::config::RuntimeConfig& config);

std::shared_ptr<tending::db::Repository> BuildRepository(const tending::runtime::config::RuntimeConfig& config);

} // namespace tending::factory
