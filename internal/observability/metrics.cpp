#include "internal/observability/spans.hpp"

#ifdef STOWAGE_ENABLE_OTEL

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

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace stowage::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> part_uploads;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      upload_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> lock_timeouts;
};

bool InitializeMetrics(const stowage::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto target = ResolveOtlpTarget(observability, "metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (target.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint = target.endpoint;
    exporter         = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  const auto interval_ms = observability.metrics_export_interval_ms() > 0 ? observability.metrics_export_interval_ms() : 1000;
  reader_options.export_interval_millis = std::chrono::milliseconds(interval_ms);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(500);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  auto resource = resource::Resource::Create({{"service.name", kServiceName}});
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
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
  auto provider = metrics_api::Provider::GetMeterProvider();
  if (!provider) {
    return;
  }

  impl_->meter              = provider->GetMeter(kServiceName, kServiceVersion);
  impl_->part_uploads       = impl_->meter->CreateUInt64Counter("stowage_part_uploads_total", "Part upload attempts by outcome");
  impl_->upload_duration_ms = impl_->meter->CreateDoubleHistogram("stowage_upload_duration_ms", "End-to-end upload latency", "ms");
  impl_->cache_lookups      = impl_->meter->CreateUInt64Counter("stowage_cache_lookups_total", "Cache lookups by outcome");
  impl_->lock_timeouts      = impl_->meter->CreateUInt64Counter("stowage_lock_timeouts_total", "Exclusive lock acquisitions that timed out");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordPartUpload(bool success) {
  if (!impl_ || !impl_->part_uploads) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->part_uploads, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveUploadDurationMs(std::string_view strategy, double duration_ms) {
  if (!impl_ || !impl_->upload_duration_ms) {
    return;
  }

  const opentelemetry::nostd::string_view    strategy_label(strategy.data(), strategy.size());
  const std::initializer_list<AttributePair> attributes = {{"strategy", strategy_label}};
  RecordWithAttributes(impl_->upload_duration_ms, duration_ms, attributes);
}

void Metrics::RecordCacheLookup(bool hit) {
  if (!impl_ || !impl_->cache_lookups) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"hit", hit}};
  AddWithAttributes(impl_->cache_lookups, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordLockTimeout() {
  if (!impl_ || !impl_->lock_timeouts) {
    return;
  }

  AddWithAttributes(impl_->lock_timeouts, static_cast<std::uint64_t>(1), std::initializer_list<AttributePair>{});
}

} // namespace stowage::observability

#endif
