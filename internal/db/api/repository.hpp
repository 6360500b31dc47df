#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/governance_record.hpp"
#include "internal/db/model/schedule_record.hpp"

namespace vesting::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A beneficiary's schedules come back in index order
  - Index assignment in AppendSchedule is atomic with the insert

  The DB is the source of truth for:
    schedules
    governance (administrator, recovery account)
    token balances, custody included
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Schedules
  // ---------------------------------------------------------------------

  virtual std::vector<model::ScheduleRecord> ListSchedules(Transaction&, const std::string& beneficiary) = 0;

  // Sets record.schedule_index to the beneficiary's current count.
  virtual Result AppendSchedule(Transaction&, model::ScheduleRecord& record) = 0;

  virtual Result UpdateSchedule(Transaction&, const model::ScheduleRecord&) = 0;

  virtual Result DeleteSchedules(Transaction&, const std::string& beneficiary) = 0;

  // Beneficiaries holding at least one schedule, sorted.
  virtual std::vector<std::string> ListBeneficiaries(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Governance
  // ---------------------------------------------------------------------

  virtual std::optional<model::GovernanceRecord> GetGovernance(Transaction&) = 0;

  virtual Result PutGovernance(Transaction&, const model::GovernanceRecord&) = 0;

  // ---------------------------------------------------------------------
  // Balances
  // ---------------------------------------------------------------------

  // Accounts without a row hold 0. Backends shared between processes
  // lock the account until the transaction ends.
  virtual uint64_t GetBalance(Transaction&, const std::string& account) = 0;

  virtual Result PutBalance(Transaction&, const std::string& account, uint64_t amount) = 0;

  // True once any balance row exists, zero rows included.
  virtual bool HasBalances(Transaction&) = 0;
};

} // namespace vesting::db
