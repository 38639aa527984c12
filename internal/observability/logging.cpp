#include "internal/observability/logging.hpp"

#include <array>
#include <cstdlib>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace shakemap::observability {
namespace {

constexpr const char* kLoggerName = "shakemap";

bool g_include_trace_context{false};

const char* Env(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str maps anything it does not know to off
  if (level == spdlog::level::off && name != "off") {
    throw std::invalid_argument("unknown log level: " + name);
  }
  return level;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\t' || c == '\n') {
      return true;
    }
  }
  return false;
}

void AppendValue(fmt::memory_buffer& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value.data(), value.data() + value.size());
    return;
  }
  out.push_back('"');
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c == '\n' ? ' ' : c);
  }
  out.push_back('"');
}

#ifdef ENABLE_OTEL
template <std::size_t N>
void AppendHex(fmt::memory_buffer& out, const std::array<uint8_t, N>& bytes) {
  for (uint8_t b : bytes) {
    fmt::format_to(std::back_inserter(out), "{:02x}", b);
  }
}

void AppendTraceContext(fmt::memory_buffer& out) {
  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }
  const auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  std::array<uint8_t, 16> trace_id{};
  std::array<uint8_t, 8>  span_id{};
  context.trace_id().CopyBytesTo(trace_id);
  context.span_id().CopyBytesTo(span_id);

  fmt::format_to(std::back_inserter(out), " trace_id=");
  AppendHex(out, trace_id);
  fmt::format_to(std::back_inserter(out), " span_id=");
  AppendHex(out, span_id);
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), fmt::format("{}", value)};
}

LogField DoubleField(std::string_view key, double value) {
  return {std::string(key), fmt::format("{}", value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogSettings ResolveLogSettings(const shakemap::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();
  LogSettings settings;

  if (const char* level = Env("SHAKEMAP_LOG_LEVEL")) {
    settings.level = ParseLevel(level);
  } else if (!logging.level().empty()) {
    settings.level = ParseLevel(logging.level());
  }

  if (const char* pattern = Env("SHAKEMAP_LOG_PATTERN")) {
    settings.pattern = pattern;
  } else if (!logging.pattern().empty()) {
    settings.pattern = logging.pattern();
  }

  if (const char* include_trace = Env("SHAKEMAP_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string flag(include_trace);
    settings.include_trace_context = flag == "1" || flag == "true";
  } else {
    settings.include_trace_context = logging.include_trace_context();
  }

  if (const char* file_path = Env("SHAKEMAP_LOG_FILE")) {
    settings.file_path = file_path;
  } else {
    settings.file_path = logging.file_path();
  }
  if (logging.max_file_bytes() > 0) {
    settings.max_file_bytes = static_cast<std::size_t>(logging.max_file_bytes());
  }
  if (logging.max_files() > 0) {
    settings.max_files = logging.max_files();
  }
  return settings;
}

std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields) {
  fmt::memory_buffer out;
  out.append(message.data(), message.data() + message.size());
  for (const auto& field : fields) {
    out.push_back(' ');
    out.append(field.key.data(), field.key.data() + field.key.size());
    out.push_back('=');
    AppendValue(out, field.value);
  }
  if (g_include_trace_context) {
    AppendTraceContext(out);
  }
  return fmt::to_string(out);
}

void InitializeLogging(const shakemap::runtime::config::RuntimeConfig& config) {
  const auto settings = ResolveLogSettings(config);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!settings.file_path.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(settings.file_path, settings.max_file_bytes, settings.max_files));
  }

  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(settings.pattern);
  logger->set_level(settings.level);
  logger->flush_on(spdlog::level::warn);

  spdlog::drop(kLoggerName);
  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = settings.include_trace_context;
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) {
    logger->flush();
  }
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) {
    return;
  }
  logger->log(level, "{}", FormatLogLine(message, fields));
}

} // namespace shakemap::observability
