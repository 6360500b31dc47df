#include "logging_event_sink.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace vesting::events {

using vesting::observability::StringField;
using vesting::observability::UintField;

void LoggingEventSink::OnScheduleCreated(const ScheduleCreated& event) {
  VESTING_LOG_INFO("schedule created", {StringField("beneficiary", event.beneficiary), UintField("schedule_index", event.schedule_index),
                                        UintField("total_amount", event.total_amount), UintField("upfront_amount", event.upfront_amount),
                                        UintField("cliff_time", event.cliff_time), UintField("ramp_end", event.ramp_end)});
  vesting::observability::Metrics::Instance().RecordScheduleCreated(event.total_amount);
}

void LoggingEventSink::OnClaimed(const Claimed& event) {
  VESTING_LOG_INFO("claimed", {StringField("beneficiary", event.beneficiary), UintField("amount", event.amount)});
  vesting::observability::Metrics::Instance().RecordClaimed(event.amount);
}

void LoggingEventSink::OnRecovered(const Recovered& event) {
  VESTING_LOG_WARN("recovered", {StringField("beneficiary", event.beneficiary), StringField("recovery_account", event.recovery_account),
                                 UintField("amount", event.amount)});
  vesting::observability::Metrics::Instance().RecordRecovered(event.amount);
}

void LoggingEventSink::OnRecoveryAccountChanged(const RecoveryAccountChanged& event) {
  VESTING_LOG_WARN("recovery account changed", {StringField("previous", event.previous), StringField("current", event.current)});
}

void LoggingEventSink::OnAdministratorChanged(const AdministratorChanged& event) {
  VESTING_LOG_WARN("administrator changed", {StringField("previous", event.previous), StringField("current", event.current)});
}

} // namespace vesting::events
