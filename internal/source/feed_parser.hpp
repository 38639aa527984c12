#pragma once

#include <string_view>

#include "shakemap/v1/event.pb.h"

namespace shakemap::source {

struct Region {
  double min_lat{0};
  double max_lat{0};
  double min_lon{0};
  double max_lon{0};

  bool Contains(double lat, double lon) const {
    return lat >= min_lat && lat <= max_lat && lon >= min_lon && lon <= max_lon;
  }
};

struct FeedFilter {
  Region region;
  double min_magnitude{0};
};

/*
  Picks the newest qualifying event out of a GeoJSON FeatureCollection
  (USGS summary feed layout):

      features[].properties.{mag, time, place}
      features[].geometry.coordinates = [lon, lat, depth_km]

  Features missing any of mag/time/coordinates are skipped. Throws
  util::UpstreamFetchError when the document is malformed or nothing
  qualifies.
*/
shakemap::v1::EventMeta ParseLatestEvent(std::string_view geojson, const FeedFilter& filter, std::string_view source_name);

} // namespace shakemap::source
