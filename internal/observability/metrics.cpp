#include "internal/observability/spans.hpp"

#include "config/config.pb.h"

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

#include <chrono>
#include <memory>
#include <utility>
#endif

namespace shakemap::observability {

#ifdef ENABLE_OTEL

namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const ExporterSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

void Emit(const opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>>& counter,
          std::initializer_list<AttributePair>                                          attributes) {
  if (counter) {
    counter->Add(1, attributes, opentelemetry::context::Context{});
  }
}

void Emit(const opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>& histogram, double value,
          std::initializer_list<AttributePair> attributes) {
  if (histogram) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      compute_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> cache_lookups;
};

bool InitializeMetrics(const shakemap::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = ResolveExporterSettings(config, "metrics");

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(5000);
  reader_options.export_timeout_millis  = std::chrono::milliseconds(2000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(settings), reader_options);

  auto attrs = resource::Resource::Create({{"service.name", settings.service_name}, {"service.version", settings.service_version}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), attrs);
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
  impl_->meter  = provider->GetMeter("shakemap-server", "0.1.0");

  impl_->request_count       = impl_->meter->CreateUInt64Counter("shakemap.request.count", "HTTP requests by route and status", "1");
  impl_->request_latency_ms  = impl_->meter->CreateDoubleHistogram("shakemap.request.latency_ms", "End-to-end request latency", "ms");
  impl_->compute_duration_ms = impl_->meter->CreateDoubleHistogram("shakemap.compute.duration_ms", "Event fetch plus overlay computation", "ms");
  impl_->cache_lookups       = impl_->meter->CreateUInt64Counter("shakemap.cache.lookups", "Cache lookups by outcome", "1");
}

Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, int status) {
  Emit(impl_->request_count, {{"route", std::string(route)}, {"status", status}});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  Emit(impl_->request_latency_ms, latency_ms, {{"route", std::string(route)}});
}

void Metrics::ObserveComputeDurationMs(std::string_view origin, double duration_ms) {
  Emit(impl_->compute_duration_ms, duration_ms, {{"origin", std::string(origin)}});
}

void Metrics::RecordCacheLookup(std::string_view outcome) {
  Emit(impl_->cache_lookups, {{"outcome", std::string(outcome)}});
}

#else

bool InitializeMetrics(const shakemap::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownMetrics() {
}

struct Metrics::Impl {};

Metrics::Metrics()  = default;
Metrics::~Metrics() = default;

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view, int) {
}

void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

void Metrics::ObserveComputeDurationMs(std::string_view, double) {
}

void Metrics::RecordCacheLookup(std::string_view) {
}

#endif

} // namespace shakemap::observability
