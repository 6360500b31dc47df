#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/vesting_service.hpp"
#include "vesting/ledger/services/v1/vesting_service.grpc.pb.h"

namespace vesting::grpc {

class VestingServer final : public vesting::ledger::services::v1::VestingService::Service {
 public:
  explicit VestingServer(std::shared_ptr<vesting::service::VestingService> svc);

  ::grpc::Status CreateSchedule(::grpc::ServerContext*, const vesting::ledger::services::v1::CreateScheduleRequest*,
                                vesting::ledger::services::v1::CreateScheduleResponse*) override;

  ::grpc::Status CreateSchedules(::grpc::ServerContext*, const vesting::ledger::services::v1::CreateSchedulesRequest*,
                                 vesting::ledger::services::v1::CreateSchedulesResponse*) override;

  ::grpc::Status Claim(::grpc::ServerContext*, const vesting::ledger::services::v1::ClaimRequest*,
                       vesting::ledger::services::v1::ClaimResponse*) override;

  ::grpc::Status PreviewClaimable(::grpc::ServerContext*, const vesting::ledger::services::v1::PreviewClaimableRequest*,
                                  vesting::ledger::services::v1::PreviewClaimableResponse*) override;

  ::grpc::Status ListSchedules(::grpc::ServerContext*, const vesting::ledger::services::v1::ListSchedulesRequest*,
                               vesting::ledger::services::v1::ListSchedulesResponse*) override;

  ::grpc::Status Recover(::grpc::ServerContext*, const vesting::ledger::services::v1::RecoverRequest*,
                         vesting::ledger::services::v1::RecoverResponse*) override;

 private:
  std::shared_ptr<vesting::service::VestingService> service_;
};

} // namespace vesting::grpc
