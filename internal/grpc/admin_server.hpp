#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/admin_service.hpp"
#include "vesting/ledger/services/v1/vesting_admin_service.grpc.pb.h"

namespace vesting::grpc {

class AdminServer final : public vesting::ledger::services::v1::VestingAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<vesting::service::AdminService> svc);

  ::grpc::Status SetRecoveryAccount(::grpc::ServerContext*, const vesting::ledger::services::v1::SetRecoveryAccountRequest*,
                                    vesting::ledger::core::v1::Governance*) override;

  ::grpc::Status TransferAdministrator(::grpc::ServerContext*, const vesting::ledger::services::v1::TransferAdministratorRequest*,
                                       vesting::ledger::core::v1::Governance*) override;

  ::grpc::Status GetGovernance(::grpc::ServerContext*, const google::protobuf::Empty*, vesting::ledger::core::v1::Governance*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const vesting::ledger::services::v1::StatsRequest*,
                       vesting::ledger::services::v1::StatsResponse*) override;

 private:
  std::shared_ptr<vesting::service::AdminService> service_;
};

} // namespace vesting::grpc
