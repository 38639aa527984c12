#include <atomic>
#include <cassert>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/cache/event_cache.hpp"
#include "internal/http/api_handlers.hpp"
#include "internal/http/http_client.hpp"
#include "internal/http/http_server.hpp"
#include "internal/overlay/intensity_grid.hpp"
#include "internal/overlay/simulator.hpp"
#include "internal/service/shakemap_service.hpp"
#include "internal/source/http_event_source.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using namespace shakemap::http;
using namespace std::chrono_literals;

constexpr auto kTimeout = std::chrono::milliseconds(5000);

std::string BaseUrl(const HttpServer& server) {
  return "http://127.0.0.1:" + std::to_string(server.port());
}

ServerOptions LocalOptions(std::size_t workers) {
  ServerOptions options;
  options.bind_address      = "127.0.0.1:0";
  options.worker_threads    = workers;
  options.max_request_bytes = 64 * 1024;
  return options;
}

// Serves the fixture feed and counts how often it was fetched.
class FeedServer {
 public:
  explicit FeedServer(std::chrono::milliseconds delay = 0ms)
      : delay_(delay),
        files_(SHAKEMAP_TEST_DATA_DIR),
        server_(LocalOptions(2), [this](const Request& request) {
          ++hits;
          std::this_thread::sleep_for(delay_);
          if (request.path == "/down") {
            return JsonResponse(502, R"({"error":"bad gateway"})");
          }
          return files_.Serve(request.path);
        }) {
    server_.Start();
  }

  std::string Url(const std::string& path) const {
    return BaseUrl(server_) + path;
  }

  std::atomic<int> hits{0};

 private:
  const std::chrono::milliseconds delay_;
  StaticFiles                     files_;
  HttpServer  server_;
};

struct Stack {
  Stack(const std::string& feed_url, std::chrono::milliseconds timeout) {
    shakemap::source::FeedFilter filter;
    filter.region = {5.0, 21.0, 97.0, 106.0};

    auto source   = std::make_shared<shakemap::source::HttpEventSource>(feed_url, timeout, filter);
    auto computer = std::make_shared<const shakemap::overlay::IntensityGridComputer>(shakemap::overlay::GridOptions{1.0, 0.25});
    cache         = std::make_shared<shakemap::cache::EventCache>(source, computer, std::nullopt);

    shakemap::service::ServiceContext ctx;
    ctx.cache     = cache;
    ctx.simulator = std::make_shared<shakemap::overlay::Simulator>(computer);

    handlers = std::make_shared<ApiHandlers>(std::make_shared<shakemap::service::ShakemapService>(ctx), StaticFiles(SHAKEMAP_TEST_DATA_DIR),
                                             CorsPolicy(std::vector<std::string>{"https://shakemap.org"}));
    auto h   = handlers;
    server   = std::make_unique<HttpServer>(LocalOptions(8), [h](const Request& request) { return h->Handle(request); });
    server->Start();
  }

  std::shared_ptr<shakemap::cache::EventCache> cache;
  std::shared_ptr<ApiHandlers>                 handlers;
  std::unique_ptr<HttpServer>                  server;
};

void TestConcurrentRequestsShareOneFetch() {
  FeedServer feed(200ms);
  Stack      stack(feed.Url("/feed.geojson"), kTimeout);

  std::vector<std::future<ClientResponse>> responses;
  for (int i = 0; i < 6; ++i) {
    responses.push_back(std::async(std::launch::async, [&stack] { return HttpClient::Get(BaseUrl(*stack.server) + "/api/run", kTimeout); }));
  }

  std::string first_body;
  for (auto& future : responses) {
    const auto response = future.get();
    assert(response.status == 200);
    if (first_body.empty()) first_body = response.body;
    // computed_at is part of the body, so one computation means identical bodies
    assert(response.body == first_body);
  }

  assert(feed.hits.load() == 1);
  assert(stack.cache->Stats().computations == 1);

  const auto state = shakemap::util::ParseObject(HttpClient::Get(BaseUrl(*stack.server) + "/api/cache_state", kTimeout).body);
  assert(state.fields().at("event_key").string_value() == "2024-03-01T12:00:00Z|18.25|98.5|5.1|12.5");
}

void TestRefreshRefetchesOverTheWire() {
  FeedServer feed;
  Stack      stack(feed.Url("/feed.geojson"), kTimeout);

  const auto refresh = HttpClient::Send("POST", BaseUrl(*stack.server) + "/api/refresh", "", kTimeout);
  assert(refresh.status == 200);
  const auto body = shakemap::util::ParseObject(refresh.body);
  assert(body.fields().at("meta").struct_value().fields().at("place").string_value() == "Myanmar-Thailand border region");

  assert(HttpClient::Send("POST", BaseUrl(*stack.server) + "/api/refresh", "", kTimeout).status == 200);
  assert(feed.hits.load() == 2);
}

void TestUpstreamErrorsSurfaceAsJson() {
  {
    FeedServer feed;
    Stack      stack(feed.Url("/down"), kTimeout);
    const auto response = HttpClient::Get(BaseUrl(*stack.server) + "/api/run", kTimeout);
    assert(response.status == 500);
    assert(shakemap::util::ParseObject(response.body).fields().at("error").string_value() == "event feed returned HTTP 502");
    assert(!stack.cache->PeekState().has_cache);
  }

  {
    FeedServer feed(1500ms);
    Stack      stack(feed.Url("/feed.geojson"), 200ms);
    const auto response = HttpClient::Get(BaseUrl(*stack.server) + "/api/run", kTimeout);
    assert(response.status == 500);
    assert(!stack.cache->PeekState().has_cache);
  }
}

void TestSimulateAndCorsOverTheWire() {
  FeedServer feed;
  Stack      stack(feed.Url("/feed.geojson"), kTimeout);

  const auto simulate = HttpClient::Send("POST", BaseUrl(*stack.server) + "/api/simulate", R"({"lat": 13.75, "lon": 100.5, "depth": 10, "mag": 5.5})",
                                         kTimeout, {{"Content-Type", "application/json"}, {"Origin", "https://shakemap.org"}});
  assert(simulate.status == 200);
  assert(simulate.headers.at("access-control-allow-origin") == "https://shakemap.org");
  assert(feed.hits.load() == 0);

  const auto preflight = HttpClient::Send("OPTIONS", BaseUrl(*stack.server) + "/api/run", "", kTimeout,
                                          {{"Origin", "https://other.example"}, {"Access-Control-Request-Method", "POST"}});
  assert(preflight.status == 400);

  assert(HttpClient::Get(BaseUrl(*stack.server) + "/missing", kTimeout).status == 404);
}

} // namespace

int main() {
  std::signal(SIGPIPE, SIG_IGN);

  TestConcurrentRequestsShareOneFetch();
  TestRefreshRefetchesOverTheWire();
  TestUpstreamErrorsSurfaceAsJson();
  TestSimulateAndCorsOverTheWire();

  std::cout << "shakemap_integration_http_server: pass\n";
  return 0;
}
