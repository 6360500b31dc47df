#pragma once

#include <cstdint>

#include "internal/model/schedule.hpp"

namespace vesting::core {

/*
  Unlock arithmetic for a single schedule.

  Pure functions of (schedule, now). Before the cliff only the upfront
  portion is unlocked; from ramp_end on everything is; in between the
  remainder unlocks linearly with truncating division. The last unit of
  the ramp therefore only unlocks at exactly ramp_end.
*/

model::Amount UnlockedAt(const model::Schedule& schedule, model::Timestamp now);

// max(UnlockedAt(now) - claimed, 0). Never exceeds Unclaimed().
model::Amount ClaimableAt(const model::Schedule& schedule, model::Timestamp now);

// floor(total * percent / 100). percent must be <= 100.
model::Amount UpfrontAmount(model::Amount total, std::uint32_t upfront_percent);

} // namespace vesting::core
