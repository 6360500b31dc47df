#pragma once

#include "internal/model/address.hpp"
#include "service_context.hpp"
#include "vesting/ledger/core/v1/governance.pb.h"
#include "vesting/ledger/services/v1/vesting_admin_service.pb.h"

namespace vesting::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  vesting::ledger::core::v1::Governance SetRecoveryAccount(const model::Address&                                      caller,
                                                           const vesting::ledger::services::v1::SetRecoveryAccountRequest& req);

  vesting::ledger::core::v1::Governance TransferAdministrator(const model::Address&                                         caller,
                                                              const vesting::ledger::services::v1::TransferAdministratorRequest& req);

  vesting::ledger::core::v1::Governance GetGovernance(const model::Address& caller);

  vesting::ledger::services::v1::StatsResponse Stats(const model::Address& caller, const vesting::ledger::services::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace vesting::service
