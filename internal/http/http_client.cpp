#include "http_client.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace shakemap::http {

namespace {

constexpr std::size_t kMaxResponseBytes = 64 << 20;

class Socket {
 public:
  explicit Socket(int fd) : fd_(fd) {
  }
  ~Socket() {
    if (fd_ >= 0) ::close(fd_);
  }
  Socket(const Socket&)            = delete;
  Socket& operator=(const Socket&) = delete;

  int fd() const {
    return fd_;
  }

 private:
  int fd_;
};

int Connect(const Url& url, std::chrono::milliseconds timeout) {
  addrinfo hints{};
  hints.ai_family   = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo*  resolved = nullptr;
  const auto port     = std::to_string(url.port);
  if (const int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &resolved); rc != 0) {
    throw std::runtime_error("cannot resolve " + url.host + ": " + gai_strerror(rc));
  }

  timeval tv{};
  tv.tv_sec  = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

  std::string last_error = "no usable address";
  int         connected  = -1;
  for (auto* ai = resolved; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error = std::strerror(errno);
      continue;
    }
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      connected = fd;
      break;
    }
    last_error = std::strerror(errno);
    ::close(fd);
  }
  freeaddrinfo(resolved);

  if (connected < 0) {
    throw std::runtime_error("connect to " + url.host + ":" + port + " failed: " + last_error);
  }
  return connected;
}

} // namespace

Url ParseUrl(std::string_view url) {
  constexpr std::string_view kScheme = "http://";
  if (url.substr(0, kScheme.size()) != kScheme) {
    throw std::invalid_argument("only http:// URLs are supported: " + std::string(url));
  }
  url.remove_prefix(kScheme.size());

  Url        out;
  const auto slash     = url.find('/');
  const auto authority = url.substr(0, slash);
  if (slash != std::string_view::npos) {
    out.target = std::string(url.substr(slash));
  }

  const auto colon = authority.rfind(':');
  if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
    out.host = std::string(authority.substr(0, colon));
    try {
      const auto port = std::stoul(std::string(authority.substr(colon + 1)));
      if (port == 0 || port > 65535) throw std::out_of_range("port");
      out.port = static_cast<uint16_t>(port);
    } catch (const std::exception&) {
      throw std::invalid_argument("invalid port in URL: " + std::string(authority));
    }
  } else {
    out.host = std::string(authority);
  }

  if (out.host.empty()) {
    throw std::invalid_argument("URL has no host");
  }
  return out;
}

ClientResponse HttpClient::Get(const std::string& url, std::chrono::milliseconds timeout) {
  return Send("GET", url, "", timeout);
}

ClientResponse HttpClient::Send(const std::string& method, const std::string& url, const std::string& body,
                                std::chrono::milliseconds timeout, const std::map<std::string, std::string>& headers) {
  const auto target = ParseUrl(url);
  Socket     socket(Connect(target, timeout));

  std::string request = method + " " + target.target + " HTTP/1.1\r\n";
  request += "Host: " + target.host + (target.port == 80 ? "" : ":" + std::to_string(target.port)) + "\r\n";
  request += "User-Agent: shakemap/0.1\r\n";
  request += "Accept: application/json\r\n";
  request += "Connection: close\r\n";
  for (const auto& [name, value] : headers) {
    request += name + ": " + value + "\r\n";
  }
  if (!body.empty() || method == "POST") {
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
  }
  request += "\r\n";
  request += body;

  std::size_t sent = 0;
  while (sent < request.size()) {
    const auto n = ::send(socket.fd(), request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      throw std::runtime_error("send failed: " + std::string(std::strerror(errno)));
    }
    sent += static_cast<std::size_t>(n);
  }

  std::string raw;
  char        buf[16384];
  while (true) {
    const auto n = ::recv(socket.fd(), buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) throw std::runtime_error("timed out waiting for " + url);
      throw std::runtime_error("recv failed: " + std::string(std::strerror(errno)));
    }
    if (n == 0) break;
    raw.append(buf, static_cast<std::size_t>(n));
    if (raw.size() > kMaxResponseBytes) {
      throw std::runtime_error("response from " + url + " is too large");
    }
  }

  return ParseResponse(raw);
}

} // namespace shakemap::http
