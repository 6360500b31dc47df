#pragma once

#include <cstdint>
#include <string>

#include "internal/model/schedule.hpp"

namespace vesting::db::model {

/*
  Persistent schedule row.

  (beneficiary, schedule_index) is the key. Indexes are dense and
  0-based per beneficiary, assigned by AppendSchedule.
*/

struct ScheduleRecord {
  std::string beneficiary;
  uint64_t    schedule_index = 0;

  ::vesting::model::Schedule schedule;
};

} // namespace vesting::db::model
