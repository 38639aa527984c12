#pragma once

#include <string>

#include "shakemap/v1/event.pb.h"

namespace shakemap::cache {

inline constexpr char kEventKeyDelimiter = '|';

/*
  Diagnostic identity of an event:

      time|lat|lon|mag|depth_km

  time is time_utc, or time_th when time_utc is empty. Absent numeric
  fields render as empty segments.
*/
std::string MakeEventKey(const shakemap::v1::EventMeta& meta);

// Shortest round-trip decimal, always with a fractional part ("5.0").
std::string FormatKeyNumber(double value);

} // namespace shakemap::cache
