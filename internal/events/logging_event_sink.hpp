#pragma once

#include "event_sink.hpp"

namespace vesting::events {

// Writes every event as a structured log line and feeds the ledger metrics.
class LoggingEventSink final : public EventSink {
 public:
  void OnScheduleCreated(const ScheduleCreated& event) override;
  void OnClaimed(const Claimed& event) override;
  void OnRecovered(const Recovered& event) override;
  void OnRecoveryAccountChanged(const RecoveryAccountChanged& event) override;
  void OnAdministratorChanged(const AdministratorChanged& event) override;
};

} // namespace vesting::events
