#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace vesting::db::postgres {

/*
  Several server processes may share one database. Schedule reads take
  row locks and balance reads take a per-account advisory lock, both
  held to the end of the transaction, so concurrent claims on the same
  beneficiary serialize instead of paying twice. Postgres aborts one
  side of a lock cycle; that surfaces as a storage error and the whole
  operation rolls back.
*/
class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception&);
};

} // namespace vesting::db::postgres
