#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "connection_queue.hpp"
#include "http_message.hpp"

namespace shakemap::http {

struct ServerOptions {
  std::string               bind_address{"0.0.0.0:8000"};
  std::size_t               worker_threads{4};
  std::size_t               max_request_bytes{1 << 20};
  std::size_t               backlog{256};
  std::chrono::milliseconds io_timeout{30000};
};

/*
  Blocking-socket HTTP/1.1 server.

  One accept thread hands sockets to a fixed worker pool; each worker
  reads one request, calls the handler and closes the connection. The
  handler runs on worker threads concurrently and must be thread-safe.
*/
class HttpServer {
 public:
  using Handler = std::function<Response(const Request&)>;

  HttpServer(ServerOptions options, Handler handler);
  ~HttpServer();

  HttpServer(const HttpServer&)            = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and starts serving. Throws std::runtime_error on bind failure.
  void Start();
  void Stop();

  // Bound port, meaningful after Start(); resolves port 0 binds.
  uint16_t port() const {
    return port_;
  }

 private:
  void AcceptLoop();
  void WorkerLoop();
  void HandleConnection(int fd);

  ServerOptions options_;
  Handler       handler_;

  int               listen_fd_{-1};
  uint16_t          port_{0};
  std::atomic<bool> running_{false};

  std::unique_ptr<ConnectionQueue> queue_;
  std::thread                      accept_thread_;
  std::vector<std::thread>         workers_;
};

// Splits "host:port". Throws std::invalid_argument.
std::pair<std::string, uint16_t> SplitHostPort(const std::string& address);

} // namespace shakemap::http
