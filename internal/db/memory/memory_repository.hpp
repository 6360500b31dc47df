#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace vesting::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::vector<model::ScheduleRecord> ListSchedules(Transaction&, const std::string& beneficiary) override;
  Result                             AppendSchedule(Transaction&, model::ScheduleRecord& record) override;
  Result                             UpdateSchedule(Transaction&, const model::ScheduleRecord&) override;
  Result                             DeleteSchedules(Transaction&, const std::string& beneficiary) override;
  std::vector<std::string>           ListBeneficiaries(Transaction&) override;

  std::optional<model::GovernanceRecord> GetGovernance(Transaction&) override;
  Result                                 PutGovernance(Transaction&, const model::GovernanceRecord&) override;

  uint64_t GetBalance(Transaction&, const std::string& account) override;
  Result   PutBalance(Transaction&, const std::string& account, uint64_t amount) override;
  bool     HasBalances(Transaction&) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, std::vector<model::ScheduleRecord>> schedules;
    std::optional<model::GovernanceRecord>                    governance;
    std::map<std::string, uint64_t>                           balances;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace vesting::db::memory
