#include "file_event_source.hpp"

#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shakemap::source {

FileEventSource::FileEventSource(std::string path, FeedFilter filter) : path_(std::move(path)), filter_(filter) {
}

shakemap::v1::EventMeta FileEventSource::FetchLatest() {
  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw util::UpstreamFetchError("cannot open event feed " + path_);
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();

  SHAKEMAP_LOG_DEBUG("Read event feed", {observability::StringField("path", path_)});
  return ParseLatestEvent(buffer.str(), filter_, "file:" + path_);
}

} // namespace shakemap::source
