#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/http/http_server.hpp"

namespace shakemap::cache { class EventCache; }
namespace shakemap::http { class ApiHandlers; }

namespace shakemap::factory {

/*
  Long-lived objects of one server process.
*/
struct Application {
  std::shared_ptr<cache::EventCache> cache;
  std::shared_ptr<http::ApiHandlers> handlers;
  http::ServerOptions                server_options;
};

/*
  Build

  Composition root: the only place that knows which event source and
  overlay computer implementations are in use.
*/
Application Build(const shakemap::runtime::config::RuntimeConfig& config);

} // namespace shakemap::factory
