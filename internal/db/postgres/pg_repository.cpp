#include "pg_repository.hpp"

namespace vesting::db::postgres {

namespace {

model::ScheduleRecord ReadSchedule(const pqxx::row& row) {
  model::ScheduleRecord r;
  r.beneficiary              = row[0].c_str();
  r.schedule_index           = row[1].as<uint64_t>();
  r.schedule.total_amount    = row[2].as<uint64_t>();
  r.schedule.claimed_amount  = row[3].as<uint64_t>();
  r.schedule.upfront_amount  = row[4].as<uint64_t>();
  r.schedule.claimable_cache = row[5].as<uint64_t>();
  r.schedule.cliff_time      = row[6].as<uint64_t>();
  r.schedule.ramp_start      = row[7].as<uint64_t>();
  r.schedule.ramp_end        = row[8].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

std::vector<model::ScheduleRecord> PgRepository::ListSchedules(Transaction& t, const std::string& beneficiary) {
  auto res = TX(t).Work().exec_prepared("list_schedules", beneficiary);

  std::vector<model::ScheduleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadSchedule(row));
  }
  return out;
}

Result PgRepository::AppendSchedule(Transaction& t, model::ScheduleRecord& r) {
  try {
    auto&      work       = TX(t).Work();
    const auto next_index = work.exec_prepared1("count_schedules", r.beneficiary)[0].as<uint64_t>();
    const auto& s         = r.schedule;
    work.exec_prepared("insert_schedule", r.beneficiary, next_index, s.total_amount, s.claimed_amount, s.upfront_amount, s.claimable_cache,
                       s.cliff_time, s.ramp_start, s.ramp_end);
    r.schedule_index = next_index;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
  try {
    const auto& s   = r.schedule;
    auto        res = TX(t).Work().exec_prepared("update_schedule", r.beneficiary, r.schedule_index, s.total_amount, s.claimed_amount,
                                                 s.upfront_amount, s.claimable_cache, s.cliff_time, s.ramp_start, s.ramp_end);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "schedule " + r.beneficiary + "#" + std::to_string(r.schedule_index));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteSchedules(Transaction& t, const std::string& beneficiary) {
  try {
    TX(t).Work().exec_prepared("delete_schedules", beneficiary);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<std::string> PgRepository::ListBeneficiaries(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_beneficiaries");

  std::vector<std::string> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.emplace_back(row[0].c_str());
  }
  return out;
}

std::optional<model::GovernanceRecord> PgRepository::GetGovernance(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("get_governance");
  if (res.empty()) return std::nullopt;

  model::GovernanceRecord r;
  r.administrator    = res[0][0].c_str();
  r.recovery_account = res[0][1].c_str();
  r.updated_at_ms    = res[0][2].as<uint64_t>();
  return r;
}

Result PgRepository::PutGovernance(Transaction& t, const model::GovernanceRecord& r) {
  try {
    TX(t).Work().exec_prepared("put_governance", r.administrator, r.recovery_account, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// Balances: the advisory lock covers accounts that have no row yet,
// which FOR UPDATE cannot.
uint64_t PgRepository::GetBalance(Transaction& t, const std::string& account) {
  auto& work = TX(t).Work();
  work.exec_prepared("lock_account", account);

  auto res = work.exec_prepared("get_balance", account);
  if (res.empty()) return 0;
  return res[0][0].as<uint64_t>();
}

Result PgRepository::PutBalance(Transaction& t, const std::string& account, uint64_t amount) {
  try {
    TX(t).Work().exec_prepared("put_balance", account, amount);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::HasBalances(Transaction& t) {
  return !TX(t).Work().exec_prepared("any_balance").empty();
}

} // namespace vesting::db::postgres
