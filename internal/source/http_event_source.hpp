#pragma once

#include <chrono>
#include <string>

#include "event_source.hpp"
#include "feed_parser.hpp"

namespace shakemap::source {

// Fetches the feed over plain HTTP with a bounded socket timeout.
class HttpEventSource final : public EventSource {
 public:
  HttpEventSource(std::string url, std::chrono::milliseconds timeout, FeedFilter filter);

  shakemap::v1::EventMeta FetchLatest() override;

 private:
  std::string               url_;
  std::chrono::milliseconds timeout_;
  FeedFilter                filter_;
};

} // namespace shakemap::source
