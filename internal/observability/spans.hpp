#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace vesting::runtime::config {
class RuntimeConfig;
}

namespace vesting::observability {

/*
  OTLP tracing and metrics. Built without ENABLE_OTEL every call below
  is an inline no-op.
*/

bool InitializeTracing(const vesting::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const vesting::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for one RPC, tagged with its route and caller address.
class RpcSpan {
 public:
  RpcSpan(std::string_view route, std::string_view caller);
  ~RpcSpan();

  RpcSpan(const RpcSpan&)            = delete;
  RpcSpan& operator=(const RpcSpan&) = delete;

  // Marks the span failed with the ledger error text.
  void Fail(std::string_view error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRpc(std::string_view route, bool success, double latency_ms);

  void RecordScheduleCreated(std::uint64_t total_amount);
  void RecordClaimed(std::uint64_t amount);
  void RecordRecovered(std::uint64_t amount);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const vesting::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const vesting::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline RpcSpan::RpcSpan(std::string_view, std::string_view) {
}

inline RpcSpan::~RpcSpan() {
}

inline void RpcSpan::Fail(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRpc(std::string_view, bool, double) {
}

inline void Metrics::RecordScheduleCreated(std::uint64_t) {
}

inline void Metrics::RecordClaimed(std::uint64_t) {
}

inline void Metrics::RecordRecovered(std::uint64_t) {
}
#endif

} // namespace vesting::observability
