#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace shakemap::runtime::config {
class RuntimeConfig;
}

namespace shakemap::observability {

// Where and how one OTLP signal ("traces" or "metrics") is exported.
struct ExporterSettings {
  std::string service_name{"shakemap-server"};
  std::string service_version{"0.1.0"};
  std::string endpoint;
  bool        http{false};
  bool        insecure{true};
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, OTEL_EXPORTER_OTLP_ENDPOINT, transport default.
ExporterSettings ResolveExporterSettings(const shakemap::runtime::config::RuntimeConfig& config, std::string_view signal);

// Both return false when the signal is disabled or the build has no OpenTelemetry.
bool InitializeTracing(const shakemap::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const shakemap::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class Stopwatch {
 public:
  Stopwatch() : started_at_(std::chrono::steady_clock::now()) {}

  double ElapsedMs() const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at_).count();
  }

 private:
  std::chrono::steady_clock::time_point started_at_;
};

// Active span for the lifetime of the object. A no-op while tracing is off.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

class Metrics {
 public:
  static Metrics& Instance();
  ~Metrics();

  void RecordRequest(std::string_view route, int status);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // origin: "latest" or "simulate"
  void ObserveComputeDurationMs(std::string_view origin, double duration_ms);

  // outcome: "hit", "miss" or "coalesced"
  void RecordCacheLookup(std::string_view outcome);

 private:
  Metrics();

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace shakemap::observability
