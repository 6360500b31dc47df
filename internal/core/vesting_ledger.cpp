#include "vesting_ledger.hpp"

#include <stdexcept>
#include <unordered_map>

#include "internal/core/reentrancy_guard.hpp"
#include "internal/core/unlock_calculator.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/observability/logging.hpp"
#include "internal/token/token_ledger.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace vesting::core {

using vesting::ledger::core::v1::LedgerStats;
using vesting::ledger::core::v1::ScheduleStatus;
using GovernanceProto = vesting::ledger::core::v1::Governance;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  throw util::StorageError(message);
}

std::string Describe(const ScheduleRequest& request, std::size_t position) {
  return "entry " + std::to_string(position) + " (" + request.beneficiary + ")";
}

void ValidateRequest(const ScheduleRequest& request, std::size_t position, const model::Address& custody) {
  if (model::IsNullAddress(request.beneficiary)) {
    throw util::InvalidBeneficiary(Describe(request, position) + ": beneficiary is the null address");
  }
  if (request.beneficiary == custody) {
    throw util::InvalidBeneficiary(Describe(request, position) + ": beneficiary is the custody account");
  }
  if (request.total_amount == 0) {
    throw util::InvalidAmount(Describe(request, position) + ": total amount must be positive");
  }
  if (request.upfront_percent > 100) {
    throw util::InvalidPercent(Describe(request, position) + ": upfront percent " + std::to_string(request.upfront_percent) + " exceeds 100");
  }
  if (request.cliff_time >= request.ramp_end) {
    throw util::InvalidTimeline(Describe(request, position) + ": cliff " + std::to_string(request.cliff_time) + " must precede ramp end " +
                                std::to_string(request.ramp_end));
  }
}

db::model::ScheduleRecord ToRecord(const ScheduleRequest& request) {
  db::model::ScheduleRecord record;
  record.beneficiary              = request.beneficiary;
  record.schedule.total_amount    = request.total_amount;
  record.schedule.claimed_amount  = 0;
  record.schedule.upfront_amount  = UpfrontAmount(request.total_amount, request.upfront_percent);
  record.schedule.claimable_cache = record.schedule.upfront_amount;
  record.schedule.cliff_time      = request.cliff_time;
  record.schedule.ramp_start      = request.cliff_time;
  record.schedule.ramp_end        = request.ramp_end;
  return record;
}

GovernanceProto ToProto(const db::model::GovernanceRecord& record) {
  GovernanceProto governance;
  governance.set_administrator(record.administrator);
  governance.set_recovery_account(record.recovery_account);
  return governance;
}

void FillSchedule(const db::model::ScheduleRecord& record, vesting::ledger::core::v1::Schedule* out) {
  out->set_beneficiary(record.beneficiary);
  out->set_schedule_index(record.schedule_index);
  out->set_total_amount(record.schedule.total_amount);
  out->set_claimed_amount(record.schedule.claimed_amount);
  out->set_upfront_amount(record.schedule.upfront_amount);
  out->set_claimable_cache(record.schedule.claimable_cache);
  out->set_cliff_time(record.schedule.cliff_time);
  out->set_ramp_start(record.schedule.ramp_start);
  out->set_ramp_end(record.schedule.ramp_end);
}

} // namespace

VestingLedger::VestingLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<token::TokenLedger> tokens,
                             std::shared_ptr<events::EventSink> events, std::shared_ptr<const util::Clock> clock, LedgerLimits limits)
    : repository_(std::move(repository)),
      tokens_(std::move(tokens)),
      events_(std::move(events)),
      clock_(std::move(clock)),
      limits_(limits) {
  if (!repository_ || !tokens_ || !events_ || !clock_) {
    throw std::invalid_argument("VestingLedger requires repository, token ledger, event sink and clock");
  }
}

model::Timestamp VestingLedger::Now() const {
  return clock_->NowUnixSeconds();
}

// ---------------------------------------------------------------------
// Governance
// ---------------------------------------------------------------------

void VestingLedger::Bootstrap(const model::Address& administrator, const model::Address& recovery_account) {
  ReentrancyGuard guard(mutex_);
  auto            tx = repository_->Begin();

  if (auto existing = repository_->GetGovernance(*tx)) {
    if (existing->administrator != administrator || existing->recovery_account != recovery_account) {
      VESTING_LOG_WARN("stored governance differs from configuration; keeping stored record",
                       {observability::StringField("administrator", existing->administrator),
                        observability::StringField("recovery_account", existing->recovery_account)});
    }
    return;
  }

  if (model::IsNullAddress(administrator)) {
    throw util::InvalidAdministrator("governance.administrator must be set on first start");
  }
  if (model::IsNullAddress(recovery_account)) {
    throw util::InvalidRecoveryAccount("governance.recovery_account must be set on first start");
  }
  RejectCustody(administrator, recovery_account);

  db::model::GovernanceRecord record;
  record.administrator    = administrator;
  record.recovery_account = recovery_account;
  record.updated_at_ms    = Now() * 1000;
  ThrowIfDbError(repository_->PutGovernance(*tx, record), "seed governance");
  tx->Commit();

  VESTING_LOG_INFO("governance seeded", {observability::StringField("administrator", administrator),
                                         observability::StringField("recovery_account", recovery_account)});
}

db::model::GovernanceRecord VestingLedger::LoadGovernance(db::Transaction& tx) const {
  auto record = repository_->GetGovernance(tx);
  if (!record) {
    throw util::StorageError("governance record missing; ledger was not bootstrapped");
  }
  return *record;
}

void VestingLedger::RequireAdministrator(db::Transaction& tx, const model::Address& caller) const {
  if (model::IsNullAddress(caller) || LoadGovernance(tx).administrator != caller) {
    throw util::Unauthorized("caller " + caller + " is not the administrator");
  }
}

void VestingLedger::RejectCustody(const model::Address& administrator, const model::Address& recovery_account) const {
  const auto& custody = tokens_->CustodyAccount();
  if (administrator == custody) {
    throw util::InvalidAdministrator("administrator must not be the custody account");
  }
  if (recovery_account == custody) {
    throw util::InvalidRecoveryAccount("recovery account must not be the custody account");
  }
}

bool VestingLedger::IsAdministrator(const model::Address& caller) const {
  auto tx = repository_->Begin();
  return !model::IsNullAddress(caller) && LoadGovernance(*tx).administrator == caller;
}

GovernanceProto VestingLedger::Governance() const {
  auto tx = repository_->Begin();
  return ToProto(LoadGovernance(*tx));
}

GovernanceProto VestingLedger::SetRecoveryAccount(const model::Address& caller, const model::Address& account) {
  ReentrancyGuard guard(mutex_);
  auto            tx = repository_->Begin();
  RequireAdministrator(*tx, caller);

  if (model::IsNullAddress(account)) {
    throw util::InvalidRecoveryAccount("recovery account must not be the null address");
  }
  RejectCustody({}, account);

  auto       record   = LoadGovernance(*tx);
  const auto previous = record.recovery_account;
  record.recovery_account = account;
  record.updated_at_ms    = Now() * 1000;
  ThrowIfDbError(repository_->PutGovernance(*tx, record), "set recovery account");
  tx->Commit();

  events_->OnRecoveryAccountChanged({previous, account});
  return ToProto(record);
}

GovernanceProto VestingLedger::TransferAdministrator(const model::Address& caller, const model::Address& administrator) {
  ReentrancyGuard guard(mutex_);
  auto            tx = repository_->Begin();
  RequireAdministrator(*tx, caller);

  if (model::IsNullAddress(administrator)) {
    throw util::InvalidAdministrator("administrator must not be the null address");
  }
  RejectCustody(administrator, {});

  auto       record   = LoadGovernance(*tx);
  const auto previous = record.administrator;
  record.administrator = administrator;
  record.updated_at_ms = Now() * 1000;
  ThrowIfDbError(repository_->PutGovernance(*tx, record), "transfer administrator");
  tx->Commit();

  events_->OnAdministratorChanged({previous, administrator});
  return ToProto(record);
}

// ---------------------------------------------------------------------
// Creation
// ---------------------------------------------------------------------

void VestingLedger::CheckScheduleLimit(uint64_t existing, uint64_t adding) const {
  if (limits_.max_schedules_per_beneficiary == 0) {
    return;
  }
  if (existing + adding > limits_.max_schedules_per_beneficiary) {
    throw util::ResourceExhausted("ScheduleLimitExceeded",
                                  "beneficiary would hold " + std::to_string(existing + adding) + " schedules, limit is " +
                                      std::to_string(limits_.max_schedules_per_beneficiary));
  }
}

void VestingLedger::Commit(db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const std::exception& e) {
    throw util::StorageError(context + ": commit failed: " + e.what());
  }
}

vesting::ledger::core::v1::Schedule VestingLedger::CreateSchedule(const model::Address& caller, const ScheduleRequest& request) {
  ReentrancyGuard guard(mutex_);
  auto            tx = repository_->Begin();
  RequireAdministrator(*tx, caller);
  ValidateRequest(request, 0, tokens_->CustodyAccount());
  CheckScheduleLimit(repository_->ListSchedules(*tx, request.beneficiary).size(), 1);

  auto record = ToRecord(request);
  ThrowIfDbError(repository_->AppendSchedule(*tx, record), "append schedule");

  if (!tokens_->TransferInto(*tx, caller, request.total_amount)) {
    throw util::TransferFailed("could not move " + std::to_string(request.total_amount) + " from " + caller + " into custody");
  }
  Commit(*tx, "create schedule");

  events_->OnScheduleCreated({record.beneficiary, record.schedule_index, record.schedule.total_amount, record.schedule.upfront_amount,
                              record.schedule.cliff_time, record.schedule.ramp_end});

  vesting::ledger::core::v1::Schedule created;
  FillSchedule(record, &created);
  return created;
}

std::vector<uint64_t> VestingLedger::CreateSchedules(const model::Address& caller, const std::vector<ScheduleRequest>& requests) {
  ReentrancyGuard guard(mutex_);
  auto            tx = repository_->Begin();
  RequireAdministrator(*tx, caller);

  if (requests.empty()) {
    throw util::InvalidAmount("batch is empty");
  }
  if (limits_.max_batch_size != 0 && requests.size() > limits_.max_batch_size) {
    throw util::ResourceExhausted("BatchTooLarge", "batch of " + std::to_string(requests.size()) + " exceeds limit of " +
                                                       std::to_string(limits_.max_batch_size));
  }

  model::Amount batch_total = 0;
  for (std::size_t i = 0; i < requests.size(); ++i) {
    ValidateRequest(requests[i], i, tokens_->CustodyAccount());
    if (batch_total > UINT64_MAX - requests[i].total_amount) {
      throw util::InvalidAmount("batch total overflows at " + Describe(requests[i], i));
    }
    batch_total += requests[i].total_amount;
  }

  if (limits_.max_schedules_per_beneficiary != 0) {
    std::unordered_map<model::Address, uint64_t> adding;
    for (const auto& request : requests) {
      ++adding[request.beneficiary];
    }
    for (const auto& [beneficiary, count] : adding) {
      CheckScheduleLimit(repository_->ListSchedules(*tx, beneficiary).size(), count);
    }
  }

  std::vector<db::model::ScheduleRecord> records;
  records.reserve(requests.size());
  for (const auto& request : requests) {
    auto record = ToRecord(request);
    ThrowIfDbError(repository_->AppendSchedule(*tx, record), "append schedule");
    records.push_back(std::move(record));
  }

  if (!tokens_->TransferInto(*tx, caller, batch_total)) {
    throw util::TransferFailed("could not move batch total " + std::to_string(batch_total) + " from " + caller + " into custody");
  }
  Commit(*tx, "create schedules");

  std::vector<uint64_t> indexes;
  indexes.reserve(records.size());
  for (const auto& record : records) {
    events_->OnScheduleCreated({record.beneficiary, record.schedule_index, record.schedule.total_amount, record.schedule.upfront_amount,
                                record.schedule.cliff_time, record.schedule.ramp_end});
    indexes.push_back(record.schedule_index);
  }
  return indexes;
}

// ---------------------------------------------------------------------
// Claim
// ---------------------------------------------------------------------

ClaimReceipt VestingLedger::Claim(const model::Address& caller) {
  ReentrancyGuard guard(mutex_);
  auto            tx  = repository_->Begin();
  const auto      now = Now();

  auto schedules = repository_->ListSchedules(*tx, caller);
  if (schedules.empty()) {
    throw util::NoSchedules("no schedules for " + caller);
  }

  model::Amount total_paid = 0;
  for (auto& record : schedules) {
    const auto due = ClaimableAt(record.schedule, now);
    if (due == 0) {
      continue;
    }
    record.schedule.claimed_amount += due;
    record.schedule.claimable_cache = record.schedule.claimable_cache > due ? record.schedule.claimable_cache - due : 0;
    total_paid += due;
    ThrowIfDbError(repository_->UpdateSchedule(*tx, record), "update schedule");
  }

  if (total_paid == 0) {
    throw util::NothingToClaim("nothing unlocked for " + caller + " at " + std::to_string(now));
  }

  if (!tokens_->TransferOut(*tx, caller, total_paid)) {
    throw util::TransferFailed("could not pay " + std::to_string(total_paid) + " to " + caller);
  }
  Commit(*tx, "claim");

  events_->OnClaimed({caller, total_paid});
  return {total_paid, now};
}

model::Amount VestingLedger::PreviewClaimable(const model::Address& beneficiary, model::Timestamp at) const {
  auto tx = repository_->Begin();

  model::Amount total = 0;
  for (const auto& record : repository_->ListSchedules(*tx, beneficiary)) {
    total += ClaimableAt(record.schedule, at);
  }
  return total;
}

std::vector<ScheduleStatus> VestingLedger::ListSchedules(const model::Address& beneficiary, model::Timestamp at) const {
  auto tx = repository_->Begin();

  std::vector<ScheduleStatus> out;
  for (const auto& record : repository_->ListSchedules(*tx, beneficiary)) {
    ScheduleStatus status;
    FillSchedule(record, status.mutable_schedule());
    status.set_evaluated_at(at);
    status.set_unlocked_amount(UnlockedAt(record.schedule, at));
    status.set_claimable_amount(ClaimableAt(record.schedule, at));
    out.push_back(std::move(status));
  }
  return out;
}

// ---------------------------------------------------------------------
// Recovery
// ---------------------------------------------------------------------

RecoveryReceipt VestingLedger::Recover(const model::Address& caller, const model::Address& beneficiary) {
  ReentrancyGuard guard(mutex_);
  auto            tx = repository_->Begin();
  RequireAdministrator(*tx, caller);

  const auto recovery_account = LoadGovernance(*tx).recovery_account;
  const auto schedules        = repository_->ListSchedules(*tx, beneficiary);
  if (schedules.empty()) {
    throw util::NoSchedules("no schedules for " + beneficiary);
  }

  model::Amount total = 0;
  for (const auto& record : schedules) {
    total += record.schedule.Unclaimed();
  }

  // cleared before the amount check; an empty sweep unwinds with the tx
  ThrowIfDbError(repository_->DeleteSchedules(*tx, beneficiary), "delete schedules");
  if (total == 0) {
    throw util::NothingToWithdraw("every schedule of " + beneficiary + " is fully claimed");
  }

  if (!tokens_->TransferOut(*tx, recovery_account, total)) {
    throw util::TransferFailed("could not move " + std::to_string(total) + " to recovery account " + recovery_account);
  }
  Commit(*tx, "recover");

  events_->OnRecovered({beneficiary, recovery_account, total});
  return {recovery_account, total};
}

// ---------------------------------------------------------------------
// Stats
// ---------------------------------------------------------------------

LedgerStats VestingLedger::Stats() const {
  LedgerStats stats;
  {
    auto tx = repository_->Begin();

    uint64_t   schedules = 0;
    const auto holders   = repository_->ListBeneficiaries(*tx);
    for (const auto& beneficiary : holders) {
      for (const auto& record : repository_->ListSchedules(*tx, beneficiary)) {
        ++schedules;
        stats.set_total_committed(stats.total_committed() + record.schedule.total_amount);
        stats.set_total_claimed(stats.total_claimed() + record.schedule.claimed_amount);
      }
    }
    stats.set_beneficiaries(holders.size());
    stats.set_schedules(schedules);
    stats.set_outstanding(stats.total_committed() - stats.total_claimed());
  }
  // the token ledger opens its own transaction
  stats.set_custody_balance(tokens_->CustodyBalance());
  return stats;
}

} // namespace vesting::core
