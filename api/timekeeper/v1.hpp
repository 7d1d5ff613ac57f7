#pragma once

#include "timekeeper/core/v1/match.pb.h"
#include "timekeeper/store/v1/store.pb.h"

#include "timekeeper/services/v1/match_timer_service.pb.h"
#include "timekeeper/services/v1/match_timer_service.grpc.pb.h"

namespace timekeeper::v1 {
using namespace ::timekeeper::core::v1;
using namespace ::timekeeper::store::v1;
using namespace ::timekeeper::services::v1;
}
