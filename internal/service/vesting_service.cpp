#include "vesting_service.hpp"

#include <vector>

#include "internal/core/vesting_ledger.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "vesting/ledger/v1.hpp"

namespace vesting::service {

using namespace vesting::ledger::v1;

namespace {

void RequireCaller(const model::Address& caller) {
  if (model::IsNullAddress(caller)) {
    throw vesting::util::Unauthorized("request carries no caller identity");
  }
}

std::vector<core::ScheduleRequest> ToScheduleRequests(const CreateSchedulesRequest& req) {
  const auto n = static_cast<std::size_t>(req.beneficiaries_size());
  if (static_cast<std::size_t>(req.total_amounts_size()) != n || static_cast<std::size_t>(req.upfront_percents_size()) != n ||
      static_cast<std::size_t>(req.cliff_times_size()) != n || static_cast<std::size_t>(req.ramp_ends_size()) != n) {
    throw vesting::util::LengthMismatch("beneficiaries=" + std::to_string(n) + " total_amounts=" + std::to_string(req.total_amounts_size()) +
                                        " upfront_percents=" + std::to_string(req.upfront_percents_size()) +
                                        " cliff_times=" + std::to_string(req.cliff_times_size()) +
                                        " ramp_ends=" + std::to_string(req.ramp_ends_size()));
  }

  std::vector<core::ScheduleRequest> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const int idx = static_cast<int>(i);
    out.push_back({req.beneficiaries(idx), req.total_amounts(idx), req.upfront_percents(idx), req.cliff_times(idx), req.ramp_ends(idx)});
  }
  return out;
}

} // namespace

VestingService::VestingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

CreateScheduleResponse VestingService::CreateSchedule(const model::Address& caller, const CreateScheduleRequest& req) {
  return ObserveRpc("VestingService.CreateSchedule", caller, [&] {
    RequireCaller(caller);
    const core::ScheduleRequest request{req.beneficiary(), req.total_amount(), req.upfront_percent(), req.cliff_time(), req.ramp_end()};

    CreateScheduleResponse resp;
    *resp.mutable_schedule() = ctx_.ledger->CreateSchedule(caller, request);
    resp.set_schedule_index(resp.schedule().schedule_index());
    return resp;
  });
}

CreateSchedulesResponse VestingService::CreateSchedules(const model::Address& caller, const CreateSchedulesRequest& req) {
  return ObserveRpc("VestingService.CreateSchedules", caller, [&] {
    RequireCaller(caller);
    const auto requests = ToScheduleRequests(req);

    CreateSchedulesResponse resp;
    for (const auto index : ctx_.ledger->CreateSchedules(caller, requests)) {
      resp.add_schedule_indexes(index);
    }
    return resp;
  });
}

ClaimResponse VestingService::Claim(const model::Address& caller, const ClaimRequest&) {
  return ObserveRpc("VestingService.Claim", caller, [&] {
    RequireCaller(caller);
    const auto receipt = ctx_.ledger->Claim(caller);

    ClaimResponse resp;
    resp.set_beneficiary(caller);
    resp.set_total_paid(receipt.total_paid);
    resp.set_claimed_at(receipt.claimed_at);
    return resp;
  });
}

PreviewClaimableResponse VestingService::PreviewClaimable(const model::Address& caller, const PreviewClaimableRequest& req) {
  return ObserveRpc("VestingService.PreviewClaimable", caller, [&] {
    const auto at = req.has_at() ? req.at() : ctx_.ledger->Now();

    PreviewClaimableResponse resp;
    resp.set_claimable_amount(ctx_.ledger->PreviewClaimable(req.beneficiary(), at));
    resp.set_evaluated_at(at);
    return resp;
  });
}

ListSchedulesResponse VestingService::ListSchedules(const model::Address& caller, const ListSchedulesRequest& req) {
  return ObserveRpc("VestingService.ListSchedules", caller, [&] {
    const auto at = req.has_at() ? req.at() : ctx_.ledger->Now();

    ListSchedulesResponse resp;
    for (auto& status : ctx_.ledger->ListSchedules(req.beneficiary(), at)) {
      *resp.add_schedules() = std::move(status);
    }
    return resp;
  });
}

RecoverResponse VestingService::Recover(const model::Address& caller, const RecoverRequest& req) {
  return ObserveRpc("VestingService.Recover", caller, [&] {
    RequireCaller(caller);
    const auto receipt = ctx_.ledger->Recover(caller, req.beneficiary());

    RecoverResponse resp;
    resp.set_beneficiary(req.beneficiary());
    resp.set_recovery_account(receipt.recovery_account);
    resp.set_amount_recovered(receipt.amount_recovered);
    return resp;
  });
}

} // namespace vesting::service
