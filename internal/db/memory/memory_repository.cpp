#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace vesting::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::vector<model::ScheduleRecord> MemoryRepository::ListSchedules(Transaction& t, const std::string& beneficiary) {
  const auto& s  = TX(t).View();
  auto        it = s.schedules.find(beneficiary);
  if (it == s.schedules.end()) return {};
  return it->second;
}

Result MemoryRepository::AppendSchedule(Transaction& t, model::ScheduleRecord& r) {
  auto& sequence   = TX(t).Mutable().schedules[r.beneficiary];
  r.schedule_index = sequence.size();
  sequence.push_back(r);
  return Result::Ok();
}

Result MemoryRepository::UpdateSchedule(Transaction& t, const model::ScheduleRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.schedules.find(r.beneficiary);
  if (it == s.schedules.end() || r.schedule_index >= it->second.size()) {
    return Result::Err(ErrorCode::NotFound, "schedule " + r.beneficiary + "#" + std::to_string(r.schedule_index));
  }
  it->second[r.schedule_index] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteSchedules(Transaction& t, const std::string& beneficiary) {
  TX(t).Mutable().schedules.erase(beneficiary);
  return Result::Ok();
}

std::vector<std::string> MemoryRepository::ListBeneficiaries(Transaction& t) {
  std::vector<std::string> out;
  for (const auto& [beneficiary, sequence] : TX(t).View().schedules) {
    if (!sequence.empty()) out.push_back(beneficiary);
  }
  return out;
}

std::optional<model::GovernanceRecord> MemoryRepository::GetGovernance(Transaction& t) {
  return TX(t).View().governance;
}

Result MemoryRepository::PutGovernance(Transaction& t, const model::GovernanceRecord& r) {
  TX(t).Mutable().governance = r;
  return Result::Ok();
}

uint64_t MemoryRepository::GetBalance(Transaction& t, const std::string& account) {
  const auto& balances = TX(t).View().balances;
  auto        it       = balances.find(account);
  return it == balances.end() ? 0 : it->second;
}

Result MemoryRepository::PutBalance(Transaction& t, const std::string& account, uint64_t amount) {
  TX(t).Mutable().balances[account] = amount;
  return Result::Ok();
}

bool MemoryRepository::HasBalances(Transaction& t) {
  return !TX(t).View().balances.empty();
}

} // namespace vesting::db::memory
