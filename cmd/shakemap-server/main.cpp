#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/http/api_handlers.hpp"
#include "internal/http/http_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using shakemap::http::HttpServer;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: shakemap-server <config.yaml> OR shakemap-server --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = shakemap::config::ConfigLoader::LoadFromYaml(config_path);

    shakemap::observability::InitializeTracing(config);
    shakemap::observability::InitializeMetrics(config);
    shakemap::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = shakemap::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    auto       handlers = app.handlers;
    HttpServer server(app.server_options, [handlers](const shakemap::http::Request& request) { return handlers->Handle(request); });

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGPIPE, SIG_IGN);

    server.Start();
    SHAKEMAP_LOG_INFO("Shakemap server started", {shakemap::observability::StringField("bind_address", config.server().bind_address()),
                                                  shakemap::observability::IntField("port", server.port())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    SHAKEMAP_LOG_INFO("Shutting down shakemap server");

    server.Stop();
    shakemap::observability::ShutdownLogging();
    shakemap::observability::ShutdownMetrics();
    shakemap::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    SHAKEMAP_LOG_ERROR("Fatal error", {shakemap::observability::StringField("error", e.what())});
    shakemap::observability::ShutdownLogging();
    shakemap::observability::ShutdownMetrics();
    shakemap::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
