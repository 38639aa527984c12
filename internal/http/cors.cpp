#include "cors.hpp"

namespace shakemap::http {

namespace {

constexpr const char* kAllowMethods = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";
constexpr const char* kMaxAge       = "600";

} // namespace

CorsPolicy::CorsPolicy(const std::vector<std::string>& allowed_origins) : allowed_(allowed_origins.begin(), allowed_origins.end()) {
}

bool CorsPolicy::IsAllowed(std::string_view origin) const {
  return allowed_.count(std::string(origin)) > 0;
}

bool CorsPolicy::IsPreflight(const Request& request) {
  return request.method == "OPTIONS" && request.Header("origin") && request.Header("access-control-request-method");
}

Response CorsPolicy::Preflight(const Request& request) const {
  const auto* origin = request.Header("origin");
  if (!origin || !IsAllowed(*origin)) {
    auto response = ContentResponse(400, "Disallowed CORS origin", "text/plain; charset=utf-8");
    response.SetHeader("Vary", "Origin");
    return response;
  }

  auto response = ContentResponse(200, "OK", "text/plain; charset=utf-8");
  response.SetHeader("Access-Control-Allow-Origin", *origin);
  response.SetHeader("Access-Control-Allow-Credentials", "true");
  response.SetHeader("Access-Control-Allow-Methods", kAllowMethods);
  response.SetHeader("Access-Control-Max-Age", kMaxAge);
  response.SetHeader("Vary", "Origin");
  if (const auto* requested = request.Header("access-control-request-headers")) {
    response.SetHeader("Access-Control-Allow-Headers", *requested);
  }
  return response;
}

void CorsPolicy::Decorate(const Request& request, Response& response) const {
  const auto* origin = request.Header("origin");
  if (!origin || !IsAllowed(*origin)) {
    return;
  }

  response.SetHeader("Access-Control-Allow-Origin", *origin);
  response.SetHeader("Access-Control-Allow-Credentials", "true");
  response.SetHeader("Vary", "Origin");
}

} // namespace shakemap::http
