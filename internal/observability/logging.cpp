#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace vesting::observability {
namespace {

// Environment overrides config, config overrides the built-in default.
std::string Setting(const char* env, const std::string& configured, const char* fallback) {
  if (const char* value = std::getenv(env)) {
    return value;
  }
  return configured.empty() ? fallback : configured;
}

bool TraceContextEnabled(const vesting::runtime::config::LoggingConfig& logging) {
  const auto value = Setting("VESTING_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "", "false");
  return value == "1" || value == "true";
}

bool g_include_trace_context{false};

bool NeedsQuoting(const std::string& value) {
  return value.empty() || value.find_first_of(" \"=") != std::string::npos;
}

void AppendValue(std::string& line, const std::string& value) {
  if (!NeedsQuoting(value)) {
    line += value;
    return;
  }
  line += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') line += '\\';
    line += c;
  }
  line += '"';
}

#ifdef ENABLE_OTEL
template <std::size_t N>
std::string Hex(const uint8_t (&bytes)[N]) {
  static constexpr char kDigits[] = "0123456789abcdef";
  std::string           out;
  out.reserve(N * 2);
  for (uint8_t b : bytes) {
    out += kDigits[b >> 4];
    out += kDigits[b & 0x0F];
  }
  return out;
}

// trace_id/span_id of the active RPC span, empty outside one.
std::string TraceContextFields() {
  if (!g_include_trace_context) {
    return {};
  }

  const auto context = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent())->GetContext();
  if (!context.IsValid()) {
    return {};
  }

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  return "trace_id=" + Hex(trace_bytes) + " span_id=" + Hex(span_bytes);
}
#else
std::string TraceContextFields() {
  return {};
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField UintField(std::string_view key, std::uint64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const vesting::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto logger = spdlog::stdout_color_mt("vesting-ledger");
  logger->set_pattern(Setting("VESTING_LOG_PATTERN", logging.pattern(), "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v"));
  logger->set_level(spdlog::level::from_str(Setting("VESTING_LOG_LEVEL", logging.level(), "info")));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);
  g_include_trace_context = TraceContextEnabled(logging);
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }

  const auto trace = TraceContextFields();
  if (!trace.empty()) {
    line += ' ';
    line += trace;
  }
  spdlog::log(level, "{}", line);
}

} // namespace vesting::observability
