#pragma once

#include <string>

#include "event_source.hpp"
#include "feed_parser.hpp"

namespace shakemap::source {

/*
  Reads the feed from a local file on every fetch, so an external
  poller can rewrite the file between refreshes.
*/
class FileEventSource final : public EventSource {
 public:
  FileEventSource(std::string path, FeedFilter filter);

  shakemap::v1::EventMeta FetchLatest() override;

 private:
  std::string path_;
  FeedFilter  filter_;
};

} // namespace shakemap::source
