#include "event_key.hpp"

#include <charconv>
#include <cmath>

namespace shakemap::cache {

std::string FormatKeyNumber(double value) {
  if (std::isnan(value)) return "nan";
  if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

  char buf[64];
  auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value);
  if (ec != std::errc{}) {
    return std::to_string(value);
  }

  std::string out(buf, end);
  if (out.find_first_of(".e") == std::string::npos) {
    out += ".0";
  }
  return out;
}

std::string MakeEventKey(const shakemap::v1::EventMeta& meta) {
  std::string key = !meta.time_utc().empty() ? meta.time_utc() : meta.time_th();

  const auto append = [&key](bool present, double value) {
    key.push_back(kEventKeyDelimiter);
    if (present) {
      key += FormatKeyNumber(value);
    }
  };

  append(meta.has_lat(), meta.lat());
  append(meta.has_lon(), meta.lon());
  append(meta.has_mag(), meta.mag());
  append(meta.has_depth_km(), meta.depth_km());
  return key;
}

} // namespace shakemap::cache
