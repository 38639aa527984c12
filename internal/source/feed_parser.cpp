#include "feed_parser.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cmath>
#include <optional>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace shakemap::source {

using google::protobuf::Struct;
using google::protobuf::Value;

namespace {

constexpr std::chrono::minutes kThailandOffset{7 * 60};

// 9999-12-31T23:59:59Z in epoch milliseconds
constexpr double kMaxEpochMs = 253402300799000.0;

const Value* Field(const Struct& object, const std::string& name) {
  auto it = object.fields().find(name);
  if (it == object.fields().end()) {
    return nullptr;
  }
  return &it->second;
}

std::optional<double> Number(const Value* value) {
  if (!value || value->kind_case() != Value::kNumberValue) {
    return std::nullopt;
  }
  return value->number_value();
}

struct Candidate {
  double      time_ms{0};
  double      lat{0};
  double      lon{0};
  double      depth_km{0};
  double      mag{0};
  std::string place;
};

std::optional<Candidate> ToCandidate(const Value& feature) {
  if (feature.kind_case() != Value::kStructValue) {
    return std::nullopt;
  }

  const auto* properties = Field(feature.struct_value(), "properties");
  const auto* geometry   = Field(feature.struct_value(), "geometry");
  if (!properties || properties->kind_case() != Value::kStructValue || !geometry || geometry->kind_case() != Value::kStructValue) {
    return std::nullopt;
  }

  const auto* coordinates = Field(geometry->struct_value(), "coordinates");
  if (!coordinates || coordinates->kind_case() != Value::kListValue || coordinates->list_value().values_size() < 2) {
    return std::nullopt;
  }

  const auto& coords = coordinates->list_value().values();
  auto        lon    = Number(&coords.Get(0));
  auto        lat    = Number(&coords.Get(1));
  auto        depth  = coords.size() > 2 ? Number(&coords.Get(2)) : std::optional<double>(0.0);
  auto        mag    = Number(Field(properties->struct_value(), "mag"));
  auto        time   = Number(Field(properties->struct_value(), "time"));
  if (!lon || !lat || !depth || !mag || !time) {
    return std::nullopt;
  }
  if (!std::isfinite(*time) || std::fabs(*time) > kMaxEpochMs) {
    return std::nullopt;
  }

  Candidate candidate;
  candidate.time_ms  = *time;
  candidate.lat      = *lat;
  candidate.lon      = *lon;
  candidate.depth_km = *depth;
  candidate.mag      = *mag;

  const auto* place = Field(properties->struct_value(), "place");
  if (place && place->kind_case() == Value::kStringValue) {
    candidate.place = place->string_value();
  }
  return candidate;
}

} // namespace

shakemap::v1::EventMeta ParseLatestEvent(std::string_view geojson, const FeedFilter& filter, std::string_view source_name) {
  Struct document;
  auto   status = google::protobuf::util::JsonStringToMessage(std::string(geojson), &document);
  if (!status.ok()) {
    throw util::UpstreamFetchError("malformed event feed: " + std::string(status.message()));
  }

  const auto* features = Field(document, "features");
  if (!features || features->kind_case() != Value::kListValue) {
    throw util::UpstreamFetchError("malformed event feed: missing features array");
  }

  std::optional<Candidate> latest;
  for (const auto& feature : features->list_value().values()) {
    auto candidate = ToCandidate(feature);
    if (!candidate || !filter.region.Contains(candidate->lat, candidate->lon) || candidate->mag < filter.min_magnitude) {
      continue;
    }
    if (!latest || candidate->time_ms > latest->time_ms) {
      latest = std::move(candidate);
    }
  }

  if (!latest) {
    throw util::UpstreamFetchError("no event in region matches the feed filter");
  }

  const auto occurred_at = util::FromUnixMillis(static_cast<std::int64_t>(latest->time_ms));

  shakemap::v1::EventMeta meta;
  meta.set_time_utc(util::FormatUtc(occurred_at));
  meta.set_time_th(util::FormatLocal(occurred_at, kThailandOffset));
  meta.set_lat(latest->lat);
  meta.set_lon(latest->lon);
  meta.set_mag(latest->mag);
  meta.set_depth_km(latest->depth_km);
  meta.set_place(latest->place);
  meta.set_source(std::string(source_name));
  meta.set_simulated(false);
  return meta;
}

} // namespace shakemap::source
