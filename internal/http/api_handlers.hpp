#pragma once

#include <functional>
#include <memory>
#include <string_view>

#include "cors.hpp"
#include "http_message.hpp"
#include "router.hpp"
#include "static_files.hpp"

namespace shakemap::service {
class ShakemapService;
}

namespace shakemap::http {

/*
  Top-level request handler: CORS preflight, route dispatch and CORS
  decoration of the result. Route handlers never let an exception
  escape; faults become {"error": ...} with status 500.
*/
class ApiHandlers {
 public:
  ApiHandlers(std::shared_ptr<service::ShakemapService> service, StaticFiles static_files, CorsPolicy cors);

  Response Handle(const Request& request) const;

 private:
  void RegisterRoutes();

  // Latency, status metric and error mapping around one route body.
  Response Guard(std::string_view route, const std::function<Response()>& body) const;

  Response Index(const Request& request) const;
  Response Static(const Request& request) const;
  Response GetRun(const Request& request) const;
  Response PostRun(const Request& request) const;
  Response Refresh(const Request& request) const;
  Response CacheState(const Request& request) const;
  Response Simulate(const Request& request) const;

  std::shared_ptr<service::ShakemapService> service_;
  StaticFiles                               static_files_;
  CorsPolicy                                cors_;
  Router                                    router_;
};

} // namespace shakemap::http
