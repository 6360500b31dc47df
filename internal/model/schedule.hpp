#pragma once

#include <cstdint>

namespace vesting::model {

using Amount    = std::uint64_t;
using Timestamp = std::uint64_t; // UNIX seconds

/*
  One vesting schedule.

  Invariants after every operation:
    claimed_amount <= total_amount
    upfront_amount <= total_amount
    cliff_time < ramp_end, ramp_start == cliff_time

  claimable_cache is advisory. It is decremented (saturating) as claims
  are paid and never recomputed; the authoritative claimable amount is
  always derived from the timeline.
*/
struct Schedule {
  Amount total_amount    = 0;
  Amount claimed_amount  = 0;
  Amount upfront_amount  = 0;
  Amount claimable_cache = 0;

  Timestamp cliff_time = 0;
  Timestamp ramp_start = 0;
  Timestamp ramp_end   = 0;

  Amount Unclaimed() const {
    return total_amount - claimed_amount;
  }
};

} // namespace vesting::model
