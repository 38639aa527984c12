#include "http_event_source.hpp"

#include "internal/http/http_client.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shakemap::source {

HttpEventSource::HttpEventSource(std::string url, std::chrono::milliseconds timeout, FeedFilter filter)
    : url_(std::move(url)), timeout_(timeout), filter_(filter) {
}

shakemap::v1::EventMeta HttpEventSource::FetchLatest() {
  http::ClientResponse response;
  try {
    response = http::HttpClient::Get(url_, timeout_);
  } catch (const std::exception& e) {
    throw util::UpstreamFetchError("event feed request failed: " + std::string(e.what()));
  }

  if (response.status != 200) {
    throw util::UpstreamFetchError("event feed returned HTTP " + std::to_string(response.status));
  }

  SHAKEMAP_LOG_DEBUG("Fetched event feed",
                     {observability::StringField("url", url_), observability::IntField("bytes", static_cast<std::int64_t>(response.body.size()))});
  return ParseLatestEvent(response.body, filter_, url_);
}

} // namespace shakemap::source
