#pragma once

#include <cstdint>
#include <string>

namespace vesting::db::model {

// Single row. Absent until the ledger seeds it on first start.
struct GovernanceRecord {
  std::string administrator;
  std::string recovery_account;

  uint64_t updated_at_ms = 0;
};

} // namespace vesting::db::model
