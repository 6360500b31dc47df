#pragma once

#include "internal/model/address.hpp"
#include "service_context.hpp"
#include "vesting/ledger/services/v1/vesting_service.pb.h"

namespace vesting::service {

/*
  Request/response adapter over VestingLedger.

  caller is the authenticated identity of the remote party; it is empty
  when the request carried none.
*/
class VestingService {
 public:
  explicit VestingService(ServiceContext ctx);

  vesting::ledger::services::v1::CreateScheduleResponse CreateSchedule(const model::Address&                                  caller,
                                                                       const vesting::ledger::services::v1::CreateScheduleRequest& req);

  vesting::ledger::services::v1::CreateSchedulesResponse CreateSchedules(const model::Address&                                   caller,
                                                                         const vesting::ledger::services::v1::CreateSchedulesRequest& req);

  vesting::ledger::services::v1::ClaimResponse Claim(const model::Address& caller, const vesting::ledger::services::v1::ClaimRequest& req);

  vesting::ledger::services::v1::PreviewClaimableResponse PreviewClaimable(const model::Address&                                    caller,
                                                                           const vesting::ledger::services::v1::PreviewClaimableRequest& req);

  vesting::ledger::services::v1::ListSchedulesResponse ListSchedules(const model::Address&                                 caller,
                                                                     const vesting::ledger::services::v1::ListSchedulesRequest& req);

  vesting::ledger::services::v1::RecoverResponse Recover(const model::Address& caller, const vesting::ledger::services::v1::RecoverRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace vesting::service
