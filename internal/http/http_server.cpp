#include "http_server.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/json.hpp"

namespace shakemap::http {

namespace {

constexpr int kAcceptPollMs = 200;

void SetTimeouts(int fd, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool SendAll(int fd, const std::string& data) {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

Response ErrorResponse(int status, const std::string& message) {
  return JsonResponse(status, util::ErrorBody(message));
}

} // namespace

std::pair<std::string, uint16_t> SplitHostPort(const std::string& address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon + 1 == address.size()) {
    throw std::invalid_argument("address must be host:port: " + address);
  }

  std::string host = address.substr(0, colon);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }

  std::size_t idx  = 0;
  unsigned    port = 0;
  try {
    port = static_cast<unsigned>(std::stoul(address.substr(colon + 1), &idx));
  } catch (const std::exception&) {
    throw std::invalid_argument("invalid port in " + address);
  }
  if (idx != address.size() - colon - 1 || port > 65535) {
    throw std::invalid_argument("invalid port in " + address);
  }
  return {host, static_cast<uint16_t>(port)};
}

HttpServer::HttpServer(ServerOptions options, Handler handler) : options_(std::move(options)), handler_(std::move(handler)) {
  if (options_.worker_threads == 0) {
    options_.worker_threads = std::max(1u, std::thread::hardware_concurrency());
  }
}

HttpServer::~HttpServer() {
  Stop();
}

void HttpServer::Start() {
  const auto [host, port] = SplitHostPort(options_.bind_address);

  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags    = AI_PASSIVE;

  addrinfo*  resolved     = nullptr;
  const auto port_str     = std::to_string(port);
  const int  resolve_code = getaddrinfo(host.empty() ? nullptr : host.c_str(), port_str.c_str(), &hints, &resolved);
  if (resolve_code != 0) {
    throw std::runtime_error("cannot resolve " + options_.bind_address + ": " + gai_strerror(resolve_code));
  }

  std::string last_error = "no usable address";
  for (auto* ai = resolved; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    if (::bind(fd, ai->ai_addr, ai->ai_addrlen) == 0 && ::listen(fd, SOMAXCONN) == 0) {
      listen_fd_ = fd;
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
  }
  freeaddrinfo(resolved);

  if (listen_fd_ < 0) {
    throw std::runtime_error("bind " + options_.bind_address + " failed: " + last_error);
  }

  sockaddr_storage bound{};
  socklen_t        bound_len = sizeof(bound);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
    port_ = bound.ss_family == AF_INET6 ? ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port)
                                        : ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
  }

  queue_   = std::make_unique<ConnectionQueue>(options_.backlog);
  running_ = true;
  for (std::size_t i = 0; i < options_.worker_threads; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::AcceptLoop, this);

  SHAKEMAP_LOG_INFO("HTTP server listening", {observability::StringField("bind_address", options_.bind_address),
                                              observability::IntField("port", port_),
                                              observability::IntField("workers", static_cast<std::int64_t>(options_.worker_threads))});
}

void HttpServer::Stop() {
  if (!running_.exchange(false)) {
    return;
  }

  if (accept_thread_.joinable()) accept_thread_.join();
  queue_->Shutdown();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  if (listen_fd_ >= 0) {
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  SHAKEMAP_LOG_INFO("HTTP server stopped");
}

void HttpServer::AcceptLoop() {
  while (running_) {
    pollfd pfd{listen_fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, kAcceptPollMs);
    if (ready <= 0) continue;

    int fd = ::accept(listen_fd_, nullptr, nullptr);
    if (fd < 0) {
      if (errno != EINTR && errno != EAGAIN) {
        SHAKEMAP_LOG_WARN("accept failed", {observability::StringField("error", std::strerror(errno))});
      }
      continue;
    }

    if (!queue_->Push(fd)) {
      SendAll(fd, Serialize(ErrorResponse(503, "server busy")));
      ::close(fd);
      SHAKEMAP_LOG_WARN("Connection rejected, worker backlog full");
    }
  }
}

void HttpServer::WorkerLoop() {
  while (auto fd = queue_->Pop()) {
    HandleConnection(*fd);
  }
}

void HttpServer::HandleConnection(int fd) {
  SetTimeouts(fd, options_.io_timeout);

  RequestParser parser(options_.max_request_bytes);
  char          buf[8192];
  while (parser.state() == RequestParser::State::kIncomplete) {
    const auto n = ::recv(fd, buf, sizeof(buf), 0);
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) break;
    parser.Feed(std::string_view(buf, static_cast<std::size_t>(n)));
  }

  Response response;
  switch (parser.state()) {
    case RequestParser::State::kIncomplete:
      // peer closed or timed out mid-request
      ::close(fd);
      return;
    case RequestParser::State::kError:
      response = ErrorResponse(parser.error_status(), parser.error());
      break;
    case RequestParser::State::kComplete:
      try {
        response = handler_(parser.request());
      } catch (const std::exception& e) {
        SHAKEMAP_LOG_ERROR("Unhandled handler error", {observability::StringField("path", parser.request().path),
                                                       observability::StringField("error", e.what())});
        response = ErrorResponse(500, "internal error");
      }
      break;
  }

  if (!SendAll(fd, Serialize(response))) {
    SHAKEMAP_LOG_DEBUG("Client went away before the response was sent");
  }
  ::close(fd);
}

} // namespace shakemap::http
