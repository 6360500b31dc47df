#include "admin_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"
#include "vesting/ledger/v1.hpp"

namespace vesting::grpc {

using namespace vesting::ledger::v1;

AdminServer::AdminServer(std::shared_ptr<vesting::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::SetRecoveryAccount(::grpc::ServerContext* ctx, const SetRecoveryAccountRequest* req, Governance* resp) {
  try {
    *resp = service_->SetRecoveryAccount(CallerFrom(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::TransferAdministrator(::grpc::ServerContext* ctx, const TransferAdministratorRequest* req, Governance* resp) {
  try {
    *resp = service_->TransferAdministrator(CallerFrom(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::GetGovernance(::grpc::ServerContext* ctx, const google::protobuf::Empty*, Governance* resp) {
  try {
    *resp = service_->GetGovernance(CallerFrom(ctx));
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext* ctx, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(CallerFrom(ctx), *req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace vesting::grpc
