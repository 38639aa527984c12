#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace shakemap::util {

// Wall-clock helpers. All times are system_clock; formatting is always UTC based.
using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

// USGS feeds carry event times as epoch milliseconds.
TimePoint FromUnixMillis(std::int64_t ms);
double    ToUnixSeconds(TimePoint tp);

// 2024-03-01T12:00:00Z
std::string FormatUtc(TimePoint tp);

// Wall clock at the given fixed offset, "2024-03-01 19:00:00".
std::string FormatLocal(TimePoint tp, std::chrono::minutes utc_offset);

} // namespace shakemap::util
