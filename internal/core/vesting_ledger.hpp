#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/address.hpp"
#include "internal/model/schedule.hpp"
#include "vesting/ledger/core/v1/governance.pb.h"
#include "vesting/ledger/core/v1/schedule.pb.h"

namespace vesting::token {
class TokenLedger;
}
namespace vesting::events {
class EventSink;
}
namespace vesting::util {
class Clock;
}

namespace vesting::core {

struct LedgerLimits {
  // 0 disables the cap
  uint64_t max_schedules_per_beneficiary = 0;
  uint64_t max_batch_size                = 0;
};

// One row of a batch create.
struct ScheduleRequest {
  model::Address   beneficiary;
  model::Amount    total_amount    = 0;
  std::uint32_t    upfront_percent = 0;
  model::Timestamp cliff_time      = 0;
  model::Timestamp ramp_end        = 0;
};

struct ClaimReceipt {
  model::Amount    total_paid = 0;
  model::Timestamp claimed_at = 0;
};

struct RecoveryReceipt {
  model::Address recovery_account;
  model::Amount  amount_recovered = 0;
};

/*
  VestingLedger

  Owns every schedule and the governance record. Tokens move through
  the TokenLedger; schedules and governance live in the Repository.

  Mutating operations are serialized by one mutex and run in a single
  repository transaction. The token transfer joins that transaction as
  the last step before commit, so any failure leaves both the schedules
  and custody unchanged. Reads open their own transaction and never
  wait on the mutex.

  The custody account never holds schedules or a governance role.

  Errors are the exception types in internal/util/errors.hpp.
*/
class VestingLedger {
 public:
  VestingLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<token::TokenLedger> tokens,
                std::shared_ptr<events::EventSink> events, std::shared_ptr<const util::Clock> clock, LedgerLimits limits = {});

  // Writes the governance record if the store has none yet. An existing
  // record wins over the arguments.
  void Bootstrap(const model::Address& administrator, const model::Address& recovery_account);

  // ---------------------------------------------------------------------
  // Administrator operations
  // ---------------------------------------------------------------------

  // Returns the stored schedule, including its assigned index.
  vesting::ledger::core::v1::Schedule CreateSchedule(const model::Address& caller, const ScheduleRequest& request);

  // All-or-nothing. Returns the index of each created schedule in order.
  std::vector<uint64_t> CreateSchedules(const model::Address& caller, const std::vector<ScheduleRequest>& requests);

  RecoveryReceipt Recover(const model::Address& caller, const model::Address& beneficiary);

  vesting::ledger::core::v1::Governance SetRecoveryAccount(const model::Address& caller, const model::Address& account);
  vesting::ledger::core::v1::Governance TransferAdministrator(const model::Address& caller, const model::Address& administrator);

  // ---------------------------------------------------------------------
  // Beneficiary operations
  // ---------------------------------------------------------------------

  // Pays out everything unlocked for the caller's own schedules.
  ClaimReceipt Claim(const model::Address& caller);

  // ---------------------------------------------------------------------
  // Reads
  // ---------------------------------------------------------------------

  model::Amount PreviewClaimable(const model::Address& beneficiary, model::Timestamp at) const;

  std::vector<vesting::ledger::core::v1::ScheduleStatus> ListSchedules(const model::Address& beneficiary, model::Timestamp at) const;

  vesting::ledger::core::v1::Governance  Governance() const;
  vesting::ledger::core::v1::LedgerStats Stats() const;

  bool IsAdministrator(const model::Address& caller) const;

  model::Timestamp Now() const;

 private:
  db::model::GovernanceRecord LoadGovernance(db::Transaction& tx) const;
  void                        RequireAdministrator(db::Transaction& tx, const model::Address& caller) const;
  void                        CheckScheduleLimit(uint64_t existing, uint64_t adding) const;

  // Empty arguments are not checked.
  void RejectCustody(const model::Address& administrator, const model::Address& recovery_account) const;

  // A failed commit rolls back schedules and balances together.
  void Commit(db::Transaction& tx, const std::string& context);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<token::TokenLedger> tokens_;
  std::shared_ptr<events::EventSink> events_;
  std::shared_ptr<const util::Clock> clock_;
  LedgerLimits                       limits_;

  // Serializes every mutating operation.
  std::mutex mutex_;
};

} // namespace vesting::core
