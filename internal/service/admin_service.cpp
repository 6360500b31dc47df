#include "admin_service.hpp"

#include "internal/core/vesting_ledger.hpp"
#include "observe_rpc.hpp"
#include "vesting/ledger/v1.hpp"

namespace vesting::service {

using namespace vesting::ledger::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

Governance AdminService::SetRecoveryAccount(const model::Address& caller, const SetRecoveryAccountRequest& req) {
  return ObserveRpc("AdminService.SetRecoveryAccount", caller,
                    [&] { return ctx_.ledger->SetRecoveryAccount(caller, req.recovery_account()); });
}

Governance AdminService::TransferAdministrator(const model::Address& caller, const TransferAdministratorRequest& req) {
  return ObserveRpc("AdminService.TransferAdministrator", caller,
                    [&] { return ctx_.ledger->TransferAdministrator(caller, req.administrator()); });
}

Governance AdminService::GetGovernance(const model::Address& caller) {
  return ObserveRpc("AdminService.GetGovernance", caller, [&] { return ctx_.ledger->Governance(); });
}

StatsResponse AdminService::Stats(const model::Address& caller, const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", caller, [&] {
    StatsResponse resp;
    *resp.mutable_stats() = ctx_.ledger->Stats();
    return resp;
  });
}

} // namespace vesting::service
