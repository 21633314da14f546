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
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <cstdlib>
#include <initializer_list>
#include <utility>

#include "config/config.pb.h"

namespace catalog::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using Attributes = std::initializer_list<std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpConfig& config) {
  std::string endpoint = config.endpoint;
  if (endpoint.empty()) {
    const char* env = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
    if (!env) env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT");
    endpoint = env ? env : config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
  }

  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      cache_build_duration_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> cache_integrity_checks;
};

bool InitializeMetrics(const catalog::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = otlp_config.export_interval;
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeExporter(otlp_config), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(),
                                                           resource::Resource::Create({{"service.name", otlp_config.service_name}}));
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

// Instruments bind to whichever provider is global on first use.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("catalog-registry");

  impl_->request_count           = impl_->meter->CreateUInt64Counter("catalog.request.count", "Registry requests", "1");
  impl_->request_latency_ms      = impl_->meter->CreateDoubleHistogram("catalog.request.latency_ms", "Registry request latency", "ms");
  impl_->cache_build_duration_ms = impl_->meter->CreateDoubleHistogram("catalog.cache.build_duration_ms", "Cache rebuild duration", "ms");
  impl_->cache_integrity_checks  = impl_->meter->CreateUInt64Counter("catalog.cache.integrity_checks", "Cache digest comparisons", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  impl_->request_count->Add(1, Attributes{{"route", std::string(route)}, {"success", success}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  impl_->request_latency_ms->Record(latency_ms, Attributes{{"route", std::string(route)}}, opentelemetry::context::Context{});
}

void Metrics::ObserveCacheBuildDurationMs(std::string_view backend, double duration_ms) {
  impl_->cache_build_duration_ms->Record(duration_ms, Attributes{{"backend", std::string(backend)}}, opentelemetry::context::Context{});
}

void Metrics::RecordCacheIntegrity(std::string_view backend, bool match) {
  impl_->cache_integrity_checks->Add(1, Attributes{{"backend", std::string(backend)}, {"match", match}});
}

} // namespace catalog::observability

#endif
