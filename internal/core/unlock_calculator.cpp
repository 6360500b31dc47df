#include "unlock_calculator.hpp"

#include <algorithm>

namespace vesting::core {

namespace {

// amounts and durations are both 64-bit, so the product needs 128.
using Wide = unsigned __int128;

} // namespace

model::Amount UnlockedAt(const model::Schedule& schedule, model::Timestamp now) {
  if (now < schedule.cliff_time) {
    return schedule.upfront_amount;
  }
  if (now >= schedule.ramp_end) {
    return schedule.total_amount;
  }
  // cliff_time <= now < ramp_end; ramp_start == cliff_time for every stored schedule,
  // but guard against a ramp that starts after now.
  if (now <= schedule.ramp_start) {
    return schedule.upfront_amount;
  }

  const Wide linear_portion = schedule.total_amount - schedule.upfront_amount;
  const Wide elapsed        = now - schedule.ramp_start;
  const Wide duration       = schedule.ramp_end - schedule.ramp_start;

  const Wide unlocked = static_cast<Wide>(schedule.upfront_amount) + linear_portion * elapsed / duration;
  return static_cast<model::Amount>(std::min<Wide>(unlocked, schedule.total_amount));
}

model::Amount ClaimableAt(const model::Schedule& schedule, model::Timestamp now) {
  const auto unlocked = UnlockedAt(schedule, now);
  return unlocked > schedule.claimed_amount ? unlocked - schedule.claimed_amount : 0;
}

model::Amount UpfrontAmount(model::Amount total, std::uint32_t upfront_percent) {
  return static_cast<model::Amount>(static_cast<Wide>(total) * upfront_percent / 100);
}

} // namespace vesting::core
