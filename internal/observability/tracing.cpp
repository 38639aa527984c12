#include "internal/observability/spans.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <mutex>
#include <utility>
#endif

namespace shakemap::observability {

ExporterSettings ResolveExporterSettings(const shakemap::runtime::config::RuntimeConfig& config, std::string_view signal) {
  const auto&      observability = config.observability();
  ExporterSettings settings;
  settings.http = observability.transport() == shakemap::runtime::config::OTLP_TRANSPORT_HTTP;

  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
    return settings;
  }

  std::string signal_var = "OTEL_EXPORTER_OTLP_";
  for (char c : signal) {
    signal_var.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
  }
  signal_var += "_ENDPOINT";

  if (const char* endpoint = std::getenv(signal_var.c_str())) {
    settings.endpoint = endpoint;
  } else if (const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = shared;
  } else if (settings.http) {
    settings.endpoint = "http://localhost:4318/v1/" + std::string(signal);
  } else {
    settings.endpoint = "localhost:4317";
  }
  return settings;
}

#ifdef ENABLE_OTEL

namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {

struct TracingState {
  std::mutex                                          mutex;
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracingState& State() {
  static TracingState state;
  return state;
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  auto&                       state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  return state.tracer;
}

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ExporterSettings& settings) {
  if (settings.http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

} // namespace

bool InitializeTracing(const shakemap::runtime::config::RuntimeConfig& config) {
  if (!config.observability().tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings  = ResolveExporterSettings(config, "traces");
  auto       processor = sdktrace::BatchSpanProcessorFactory::Create(MakeSpanExporter(settings), sdktrace::BatchSpanProcessorOptions{});
  auto       attrs     = resource::Resource::Create({{"service.name", settings.service_name}, {"service.version", settings.service_version}});
  std::shared_ptr<sdktrace::TracerProvider> provider = sdktrace::TracerProviderFactory::Create(std::move(processor), attrs);

  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  auto&                       state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  state.tracer   = provider->GetTracer(settings.service_name, settings.service_version);
  state.provider = std::move(provider);
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  auto&                       state = State();
  std::lock_guard<std::mutex> lock(state.mutex);
  if (state.provider) {
    state.provider->ForceFlush();
    state.provider->Shutdown();
  }
  state.provider.reset();
  state.tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }
  impl_        = std::make_unique<Impl>();
  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_) {
    impl_->span->SetAttribute(std::string(key), value);
  }
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) {
    impl_->span->AddEvent(std::string(name));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) {
    return;
  }
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

#else

bool InitializeTracing(const shakemap::runtime::config::RuntimeConfig&) {
  return false;
}

void ShutdownTracing() {
}

struct SpanScope::Impl {};

SpanScope::SpanScope(std::string_view) {
}

SpanScope::~SpanScope() = default;

void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

void SpanScope::SetAttribute(std::string_view, double) {
}

void SpanScope::AddEvent(std::string_view) {
}

void SpanScope::RecordException(std::string_view) {
}

#endif

} // namespace shakemap::observability
