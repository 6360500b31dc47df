#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace vesting::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace vesting::db::sqlite
