#pragma once

#include <memory>

namespace tending::core { class InstanceManager; }

namespace tending::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<tending::core::InstanceManager> manager;
};

}
