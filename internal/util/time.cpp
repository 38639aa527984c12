#include "time.hpp"

#include <ctime>
#include <stdexcept>

namespace shakemap::util {

namespace {

std::string Format(TimePoint tp, const char* pattern) {
  const std::time_t t = Clock::to_time_t(std::chrono::floor<std::chrono::seconds>(tp));
  std::tm           tm{};
  if (gmtime_r(&t, &tm) == nullptr) {
    throw std::runtime_error("time point out of calendar range");
  }

  char buf[32];
  const auto len = std::strftime(buf, sizeof(buf), pattern, &tm);
  return std::string(buf, len);
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

TimePoint FromUnixMillis(std::int64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

double ToUnixSeconds(TimePoint tp) {
  return std::chrono::duration<double>(tp.time_since_epoch()).count();
}

std::string FormatUtc(TimePoint tp) {
  return Format(tp, "%Y-%m-%dT%H:%M:%SZ");
}

std::string FormatLocal(TimePoint tp, std::chrono::minutes utc_offset) {
  return Format(tp + utc_offset, "%Y-%m-%d %H:%M:%S");
}

} // namespace shakemap::util
