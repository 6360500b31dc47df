#include "vesting_server.hpp"

#include "caller_identity.hpp"
#include "grpc_error.hpp"
#include "vesting/ledger/v1.hpp"

namespace vesting::grpc {

using namespace vesting::ledger::v1;

namespace {

// Runs one unary call and maps any exception to a status.
template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

VestingServer::VestingServer(std::shared_ptr<vesting::service::VestingService> svc) : service_(std::move(svc)) {
}

::grpc::Status VestingServer::CreateSchedule(::grpc::ServerContext* ctx, const CreateScheduleRequest* req, CreateScheduleResponse* resp) {
  return Handle([&] { *resp = service_->CreateSchedule(CallerFrom(ctx), *req); });
}

::grpc::Status VestingServer::CreateSchedules(::grpc::ServerContext* ctx, const CreateSchedulesRequest* req, CreateSchedulesResponse* resp) {
  return Handle([&] { *resp = service_->CreateSchedules(CallerFrom(ctx), *req); });
}

::grpc::Status VestingServer::Claim(::grpc::ServerContext* ctx, const ClaimRequest* req, ClaimResponse* resp) {
  return Handle([&] { *resp = service_->Claim(CallerFrom(ctx), *req); });
}

::grpc::Status VestingServer::PreviewClaimable(::grpc::ServerContext* ctx, const PreviewClaimableRequest* req, PreviewClaimableResponse* resp) {
  return Handle([&] { *resp = service_->PreviewClaimable(CallerFrom(ctx), *req); });
}

::grpc::Status VestingServer::ListSchedules(::grpc::ServerContext* ctx, const ListSchedulesRequest* req, ListSchedulesResponse* resp) {
  return Handle([&] { *resp = service_->ListSchedules(CallerFrom(ctx), *req); });
}

::grpc::Status VestingServer::Recover(::grpc::ServerContext* ctx, const RecoverRequest* req, RecoverResponse* resp) {
  return Handle([&] { *resp = service_->Recover(CallerFrom(ctx), *req); });
}

} // namespace vesting::grpc
