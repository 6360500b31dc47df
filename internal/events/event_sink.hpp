#pragma once

#include <cstdint>

#include "internal/model/address.hpp"
#include "internal/model/schedule.hpp"

namespace vesting::events {

struct ScheduleCreated {
  model::Address   beneficiary;
  std::uint64_t    schedule_index = 0;
  model::Amount    total_amount   = 0;
  model::Amount    upfront_amount = 0;
  model::Timestamp cliff_time     = 0;
  model::Timestamp ramp_end       = 0;
};

struct Claimed {
  model::Address beneficiary;
  model::Amount  amount = 0;
};

struct Recovered {
  model::Address beneficiary;
  model::Address recovery_account;
  model::Amount  amount = 0;
};

struct RecoveryAccountChanged {
  model::Address previous;
  model::Address current;
};

struct AdministratorChanged {
  model::Address previous;
  model::Address current;
};

/*
  Structured notifications for off-system observers.

  Emitted after the operation has committed. Not required for
  correctness; a sink must not throw.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void OnScheduleCreated(const ScheduleCreated& event)               = 0;
  virtual void OnClaimed(const Claimed& event)                               = 0;
  virtual void OnRecovered(const Recovered& event)                           = 0;
  virtual void OnRecoveryAccountChanged(const RecoveryAccountChanged& event) = 0;
  virtual void OnAdministratorChanged(const AdministratorChanged& event)     = 0;
};

} // namespace vesting::events
