#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include "http_message.hpp"

namespace shakemap::http {

struct Url {
  std::string host;
  uint16_t    port{80};
  std::string target{"/"};
};

// Accepts http://host[:port][/path]. Throws std::invalid_argument.
Url ParseUrl(std::string_view url);

/*
  Minimal blocking HTTP/1.1 client: one request per connection, the
  response is read until the server closes. Throws std::runtime_error on
  connect, timeout or protocol failures.
*/
class HttpClient {
 public:
  static ClientResponse Get(const std::string& url, std::chrono::milliseconds timeout);

  static ClientResponse Send(const std::string& method, const std::string& url, const std::string& body,
                             std::chrono::milliseconds timeout, const std::map<std::string, std::string>& headers = {});
};

} // namespace shakemap::http
