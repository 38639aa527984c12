#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace shakemap::runtime::config {
class RuntimeConfig;
}

namespace shakemap::observability {

// One key=value pair appended to a log line.
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

// Effective logger settings after SHAKEMAP_LOG_* environment overrides are applied.
struct LogSettings {
  spdlog::level::level_enum level{spdlog::level::info};
  std::string               pattern{"%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v"};
  bool                      include_trace_context{false};
  std::string               file_path;
  std::size_t               max_file_bytes{10 * 1024 * 1024};
  std::size_t               max_files{3};
};

// Throws std::invalid_argument on an unknown level name.
LogSettings ResolveLogSettings(const shakemap::runtime::config::RuntimeConfig& config);

// Renders "message k=v k2=\"v 2\"". Values with spaces, quotes or '=' are quoted.
std::string FormatLogLine(std::string_view message, std::initializer_list<LogField> fields = {});

void InitializeLogging(const shakemap::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

} // namespace shakemap::observability

#define SHAKEMAP_LOG_DEBUG(message, ...) ::shakemap::observability::Log(::spdlog::level::debug, (message), ##__VA_ARGS__)
#define SHAKEMAP_LOG_INFO(message, ...) ::shakemap::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define SHAKEMAP_LOG_WARN(message, ...) ::shakemap::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define SHAKEMAP_LOG_ERROR(message, ...) ::shakemap::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
