#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "http_message.hpp"

namespace shakemap::http {

/*
  Cross-origin policy for an allow-list of front-end origins. Any
  method and header is permitted from an allowed origin and credentials
  are allowed.
*/
class CorsPolicy {
 public:
  explicit CorsPolicy(const std::vector<std::string>& allowed_origins);

  bool IsAllowed(std::string_view origin) const;

  // OPTIONS carrying Origin and Access-Control-Request-Method.
  static bool IsPreflight(const Request& request);

  // 200 with the allow headers, or 400 for an origin outside the list.
  Response Preflight(const Request& request) const;

  // Adds allow headers to a simple response when the origin is allowed.
  void Decorate(const Request& request, Response& response) const;

 private:
  std::unordered_set<std::string> allowed_;
};

} // namespace shakemap::http
