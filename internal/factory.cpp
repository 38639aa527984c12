#include "factory.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/event_cache.hpp"
#include "internal/http/api_handlers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/overlay/intensity_grid.hpp"
#include "internal/overlay/simulator.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/shakemap_service.hpp"
#include "internal/source/file_event_source.hpp"
#include "internal/source/http_event_source.hpp"

namespace shakemap::factory {

using shakemap::runtime::config::RuntimeConfig;

namespace {

source::FeedFilter BuildFilter(const shakemap::runtime::config::SourceConfig& config) {
  source::FeedFilter filter;
  filter.region.min_lat = config.region().min_lat();
  filter.region.max_lat = config.region().max_lat();
  filter.region.min_lon = config.region().min_lon();
  filter.region.max_lon = config.region().max_lon();
  filter.min_magnitude  = config.min_magnitude();
  return filter;
}

std::shared_ptr<source::EventSource> BuildSource(const shakemap::runtime::config::SourceConfig& config) {
  switch (config.kind()) {
    case shakemap::runtime::config::SOURCE_KIND_FILE:
      return std::make_shared<source::FileEventSource>(config.path(), BuildFilter(config));
    case shakemap::runtime::config::SOURCE_KIND_HTTP:
      return std::make_shared<source::HttpEventSource>(config.url(), std::chrono::milliseconds(config.timeout_ms()), BuildFilter(config));
    default:
      throw std::runtime_error("unsupported event source kind");
  }
}

std::optional<std::chrono::seconds> BuildTtl(const shakemap::runtime::config::CacheConfig& config) {
  if (!config.has_ttl_sec() || config.ttl_sec() == 0) {
    return std::nullopt;
  }
  return std::chrono::seconds(config.ttl_sec());
}

http::ServerOptions BuildServerOptions(const shakemap::runtime::config::ServerConfig& config) {
  http::ServerOptions options;
  options.bind_address      = config.bind_address();
  options.worker_threads    = config.worker_threads();
  options.max_request_bytes = config.max_request_bytes();
  if (options.worker_threads == 0) {
    options.worker_threads = std::max(1u, std::thread::hardware_concurrency());
  }
  return options;
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Event source and overlay
  // ------------------------------------------------------------------
  auto event_source = BuildSource(config.source());

  overlay::GridOptions grid;
  grid.half_width_deg = config.overlay().half_width_deg();
  grid.spacing_deg    = config.overlay().spacing_deg();
  auto computer       = std::make_shared<const overlay::IntensityGridComputer>(grid);

  // ------------------------------------------------------------------
  // Cache and services
  // ------------------------------------------------------------------
  app.cache = std::make_shared<cache::EventCache>(event_source, computer, BuildTtl(config.cache()));

  service::ServiceContext ctx;
  ctx.cache     = app.cache;
  ctx.simulator = std::make_shared<overlay::Simulator>(computer);

  auto shakemap_service = std::make_shared<service::ShakemapService>(ctx);

  // ------------------------------------------------------------------
  // HTTP surface
  // ------------------------------------------------------------------
  std::vector<std::string> origins(config.server().cors_allowed_origins().begin(), config.server().cors_allowed_origins().end());
  app.handlers       = std::make_shared<http::ApiHandlers>(shakemap_service, http::StaticFiles(config.server().static_dir()), http::CorsPolicy(origins));
  app.server_options = BuildServerOptions(config.server());

  SHAKEMAP_LOG_INFO("Application built", {observability::StringField("source", config.source().kind() == shakemap::runtime::config::SOURCE_KIND_HTTP
                                                                                   ? config.source().url()
                                                                                   : config.source().path()),
                                          observability::IntField("ttl_sec", app.cache->ttl() ? app.cache->ttl()->count() : 0),
                                          observability::IntField("worker_threads", static_cast<std::int64_t>(app.server_options.worker_threads))});
  return app;
}

} // namespace shakemap::factory
