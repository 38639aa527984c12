#pragma once

#include "shakemap/v1/event.pb.h"

namespace shakemap::source {

/*
  Supplies metadata of the most recent event in the configured region.

  Implementations may block on I/O. Failures surface as
  util::UpstreamFetchError.
*/
class EventSource {
 public:
  virtual ~EventSource() = default;

  virtual shakemap::v1::EventMeta FetchLatest() = 0;
};

} // namespace shakemap::source
