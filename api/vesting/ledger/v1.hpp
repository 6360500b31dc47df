#pragma once

#include "vesting/ledger/core/v1/governance.pb.h"
#include "vesting/ledger/core/v1/schedule.pb.h"

#include "vesting/ledger/services/v1/vesting_admin_service.pb.h"
#include "vesting/ledger/services/v1/vesting_service.pb.h"

#include "vesting/ledger/services/v1/vesting_admin_service.grpc.pb.h"
#include "vesting/ledger/services/v1/vesting_service.grpc.pb.h"

namespace vesting::ledger::v1 {
using namespace ::vesting::ledger::core::v1;
using namespace ::vesting::ledger::services::v1;
}
