#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace vesting::runtime::config {
class RuntimeConfig;
}

namespace vesting::observability {

// key=value pair appended to a log line. Values with spaces, quotes or
// '=' are quoted so ledger error text stays one field.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField UintField(std::string_view key, std::uint64_t value);

void InitializeLogging(const vesting::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace vesting::observability

#define VESTING_LOG_INFO(message, ...) ::vesting::observability::LogInfo((message), ##__VA_ARGS__)
#define VESTING_LOG_WARN(message, ...) ::vesting::observability::LogWarn((message), ##__VA_ARGS__)
#define VESTING_LOG_ERROR(message, ...) ::vesting::observability::LogError((message), ##__VA_ARGS__)
