#pragma once

#include "receiver/manager/core/v1/action.pb.h"
#include "receiver/manager/core/v1/receiver.pb.h"

#include "receiver/manager/services/v1/receiver_service.pb.h"
#include "receiver/manager/services/v1/trigger_service.pb.h"

#include "receiver/manager/services/v1/receiver_service.grpc.pb.h"
#include "receiver/manager/services/v1/trigger_service.grpc.pb.h"

namespace receiver::manager::v1 {
using namespace ::receiver::manager::core::v1;
using namespace ::receiver::manager::services::v1;
}
