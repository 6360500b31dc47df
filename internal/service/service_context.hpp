#pragma once

#include <memory>

namespace vesting::core {
class VestingLedger;
}

namespace vesting::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<vesting::core::VestingLedger> ledger;
};

} // namespace vesting::service
