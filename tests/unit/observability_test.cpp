#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

#include <cassert>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"

namespace {

using shakemap::runtime::config::RuntimeConfig;
namespace obs = shakemap::observability;

void ClearEnv() {
  for (const char* name : {"SHAKEMAP_LOG_LEVEL", "SHAKEMAP_LOG_PATTERN", "SHAKEMAP_LOG_INCLUDE_TRACE_CONTEXT", "SHAKEMAP_LOG_FILE",
                           "OTEL_EXPORTER_OTLP_ENDPOINT", "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT"}) {
    unsetenv(name);
  }
}

void TestLogLineQuotesValues() {
  const auto line = obs::FormatLogLine("Cache refreshed", {obs::StringField("event_key", "2024-03-01T12:00:00Z|18.2500|98.5000|5.1"),
                                                           obs::StringField("place", "Myanmar-Thailand border region"),
                                                           obs::IntField("bytes", 42), obs::BoolField("forced", true), obs::StringField("note", "")});
  assert(line == "Cache refreshed event_key=2024-03-01T12:00:00Z|18.2500|98.5000|5.1 place=\"Myanmar-Thailand border region\" bytes=42 "
                 "forced=true note=\"\"");

  assert(obs::FormatLogLine("x", {obs::StringField("error", "bad \"token\"")}) == "x error=\"bad \\\"token\\\"\"");
  assert(obs::FormatLogLine("plain") == "plain");
}

void TestLogSettingsDefaults() {
  ClearEnv();
  RuntimeConfig config;
  const auto    settings = obs::ResolveLogSettings(config);
  assert(settings.level == spdlog::level::info);
  assert(settings.file_path.empty());
  assert(!settings.include_trace_context);
  assert(settings.max_files == 3);
}

void TestLogSettingsFromConfigAndEnv() {
  ClearEnv();
  RuntimeConfig config;
  config.mutable_logging()->set_level("warn");
  config.mutable_logging()->set_file_path("/tmp/shakemap.log");
  config.mutable_logging()->set_max_file_bytes(4096);
  config.mutable_logging()->set_max_files(7);

  auto settings = obs::ResolveLogSettings(config);
  assert(settings.level == spdlog::level::warn);
  assert(settings.file_path == "/tmp/shakemap.log");
  assert(settings.max_file_bytes == 4096);
  assert(settings.max_files == 7);

  setenv("SHAKEMAP_LOG_LEVEL", "debug", 1);
  setenv("SHAKEMAP_LOG_INCLUDE_TRACE_CONTEXT", "true", 1);
  settings = obs::ResolveLogSettings(config);
  assert(settings.level == spdlog::level::debug);
  assert(settings.include_trace_context);
  ClearEnv();
}

void TestUnknownLogLevelRejected() {
  ClearEnv();
  RuntimeConfig config;
  config.mutable_logging()->set_level("loud");
  bool threw = false;
  try {
    obs::ResolveLogSettings(config);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  config.mutable_logging()->set_level("off");
  assert(obs::ResolveLogSettings(config).level == spdlog::level::off);
}

void TestExporterEndpointPrecedence() {
  ClearEnv();
  RuntimeConfig config;
  assert(obs::ResolveExporterSettings(config, "traces").endpoint == "localhost:4317");

  config.mutable_observability()->set_transport(shakemap::runtime::config::OTLP_TRANSPORT_HTTP);
  auto settings = obs::ResolveExporterSettings(config, "metrics");
  assert(settings.http);
  assert(settings.endpoint == "http://localhost:4318/v1/metrics");

  setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "http://collector:4318", 1);
  assert(obs::ResolveExporterSettings(config, "traces").endpoint == "http://collector:4318");
  setenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "http://traces:4318/v1/traces", 1);
  assert(obs::ResolveExporterSettings(config, "traces").endpoint == "http://traces:4318/v1/traces");

  config.mutable_observability()->set_otlp_endpoint("http://configured:4318");
  assert(obs::ResolveExporterSettings(config, "traces").endpoint == "http://configured:4318");
  ClearEnv();
}

void TestDisabledSignalsInitializeToFalse() {
  RuntimeConfig config;
  assert(!obs::InitializeTracing(config));
  assert(!obs::InitializeMetrics(config));

  obs::SpanScope span("noop");
  span.SetAttribute("k", std::string_view("v"));
  span.SetAttribute("count", static_cast<std::int64_t>(3));
  span.SetAttribute("elapsed_ms", 1.5);
  span.AddEvent("event fetched");
  span.RecordException("ignored");
  obs::Metrics::Instance().RecordCacheLookup("hit");
}

} // namespace

int main() {
  TestLogLineQuotesValues();
  TestLogSettingsDefaults();
  TestLogSettingsFromConfigAndEnv();
  TestUnknownLogLevelRejected();
  TestExporterEndpointPrecedence();
  TestDisabledSignalsInitializeToFalse();

  std::cout << "shakemap_unit_observability: pass\n";
  return 0;
}
