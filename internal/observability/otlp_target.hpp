#pragma once

#include <cstdlib>
#include <string>

#include "config/config.pb.h"

namespace vesting::observability {

inline constexpr const char* kServiceName    = "vesting-ledger";
inline constexpr const char* kServiceVersion = "1.0.0";

// Where one OTLP signal (traces or metrics) is exported.
struct OtlpTarget {
  std::string endpoint;
  bool        http = false;
};

// Explicit config wins, then the per-signal and generic OTEL_* variables,
// then the collector's default port for the transport.
inline OtlpTarget ResolveOtlpTarget(const vesting::runtime::config::ObservabilityConfig& config, const char* signal_env,
                                    const char* http_path) {
  OtlpTarget target;
  target.http = config.transport() == vesting::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(signal_env)) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = endpoint;
  } else {
    target.endpoint = target.http ? std::string("http://localhost:4318") + http_path : std::string("localhost:4317");
  }
  return target;
}

} // namespace vesting::observability
