#pragma once

#include <chrono>
#include <exception>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace vesting::service {

// Wraps one RPC body in a span, request metrics and a failure log line.
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view caller, Fn&& fn) {
  vesting::observability::RpcSpan span(route, caller);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - started_at;
    vesting::observability::Metrics::Instance().RecordRpc(route, success, elapsed.count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.Fail(ex.what());
    VESTING_LOG_ERROR("RPC failed", {vesting::observability::StringField("route", route), vesting::observability::StringField("caller", caller),
                                     vesting::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace vesting::service
