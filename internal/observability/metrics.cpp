#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <chrono>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>

#include "internal/observability/otlp_target.hpp"

namespace vesting::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Switches from MetricsConfig; all on until InitializeMetrics reads them.
struct MetricSwitches {
  bool rpc{true};
  bool rpc_latency{true};
  bool route_labels{true};
  bool ledger{true};
};

MetricSwitches g_switches;

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpTarget& target) {
  if (target.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

sdkmetrics::PeriodicExportingMetricReaderOptions ReaderOptions(const vesting::runtime::config::ObservabilityConfig_MetricsConfig& config) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  const auto interval_ms         = config.collection_interval_ms() > 0 ? config.collection_interval_ms() : 1000;
  options.export_interval_millis = std::chrono::milliseconds(std::max(config.min_collection_interval_ms(), interval_ms));
  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(config.export_timeout_ms());
  }
  return options;
}

template <typename Instrument, typename Value>
void Add(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes attributes = {}) {
  instrument->Add(value, attributes, opentelemetry::context::Context{});
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> rpc_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      rpc_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> schedules_created;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> committed_amount;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> claimed_amount;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> recovered_amount;
};

bool InitializeMetrics(const vesting::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metric_config = observability.metrics();
  const auto  target        = ResolveOtlpTarget(observability, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");
  auto        reader        = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(target), ReaderOptions(metric_config));

  resource::ResourceAttributes attrs = {{"service.name", kServiceName}, {"service.version", kServiceVersion}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_switches.rpc          = metric_config.request_metrics_enabled();
  g_switches.rpc_latency  = metric_config.request_latency_histograms_enabled();
  g_switches.route_labels = metric_config.route_labels_enabled();
  g_switches.ledger       = metric_config.ledger_metrics_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kServiceName, kServiceVersion);

  impl_->rpc_count         = impl_->meter->CreateUInt64Counter("vesting.rpc.count", "Ledger RPCs served", "1");
  impl_->rpc_latency_ms    = impl_->meter->CreateDoubleHistogram("vesting.rpc.latency_ms", "Ledger RPC latency", "ms");
  impl_->schedules_created = impl_->meter->CreateUInt64Counter("vesting.schedules.created", "Schedules created", "1");
  impl_->committed_amount  = impl_->meter->CreateUInt64Counter("vesting.committed.amount", "Token units moved into custody", "1");
  impl_->claimed_amount    = impl_->meter->CreateUInt64Counter("vesting.claimed.amount", "Token units paid to beneficiaries", "1");
  impl_->recovered_amount  = impl_->meter->CreateUInt64Counter("vesting.recovered.amount", "Token units swept to the recovery account", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRpc(std::string_view route, bool success, double latency_ms) {
  if (!g_switches.rpc) {
    return;
  }

  const opentelemetry::nostd::string_view method(route.data(), route.size());
  if (g_switches.route_labels) {
    Add(impl_->rpc_count, std::uint64_t{1}, {{"rpc.method", method}, {"success", success}});
  } else {
    Add(impl_->rpc_count, std::uint64_t{1}, {{"success", success}});
  }

  if (!g_switches.rpc_latency) {
    return;
  }
  if (g_switches.route_labels) {
    impl_->rpc_latency_ms->Record(latency_ms, Attributes{{"rpc.method", method}}, opentelemetry::context::Context{});
  } else {
    impl_->rpc_latency_ms->Record(latency_ms, opentelemetry::context::Context{});
  }
}

void Metrics::RecordScheduleCreated(std::uint64_t total_amount) {
  if (!g_switches.ledger) {
    return;
  }
  Add(impl_->schedules_created, std::uint64_t{1});
  Add(impl_->committed_amount, total_amount);
}

void Metrics::RecordClaimed(std::uint64_t amount) {
  if (g_switches.ledger) {
    Add(impl_->claimed_amount, amount);
  }
}

void Metrics::RecordRecovered(std::uint64_t amount) {
  if (g_switches.ledger) {
    Add(impl_->recovered_amount, amount);
  }
}

} // namespace vesting::observability

#endif
