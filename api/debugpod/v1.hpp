#pragma once

#include "debugpod/v1/instance.pb.h"
#include "debugpod/v1/instance_admin_service.grpc.pb.h"
#include "debugpod/v1/instance_admin_service.pb.h"

namespace debugpod::v1 {

// Convenience aliases for clients.
using InstanceAdminStub = InstanceAdminService::Stub;

} // namespace debugpod::v1
