#pragma once

#include "tending/manager/core/v1/types.pb.h"

#include "tending/manager/services/v1/tending_service.pb.h"
#include "tending/manager/services/v1/tending_service.grpc.pb.h"

namespace tending::manager::v1 {
using namespace ::tending::manager::core::v1;
using namespace ::tending::manager::services::v1;
}
