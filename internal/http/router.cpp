#include "router.hpp"

#include <utility>

#include "internal/util/json.hpp"

namespace shakemap::http {

bool Router::Route::Matches(const std::string& request_path) const {
  return prefix ? request_path.rfind(path, 0) == 0 : request_path == path;
}

void Router::Add(std::string method, std::string path, Handler handler) {
  routes_.push_back({std::move(method), std::move(path), false, std::move(handler)});
}

void Router::AddPrefix(std::string method, std::string prefix, Handler handler) {
  routes_.push_back({std::move(method), std::move(prefix), true, std::move(handler)});
}

Response Router::Dispatch(const Request& request) const {
  std::string allowed;
  for (const bool prefix_pass : {false, true}) {
    for (const auto& route : routes_) {
      if (route.prefix != prefix_pass || !route.Matches(request.path)) continue;
      if (route.method == request.method) return route.handler(request);

      if (allowed.find(route.method) == std::string::npos) {
        allowed += allowed.empty() ? route.method : ", " + route.method;
      }
    }
    if (!allowed.empty()) break;
  }

  if (!allowed.empty()) {
    auto response = JsonResponse(405, util::ErrorBody("method not allowed"));
    response.SetHeader("Allow", allowed);
    return response;
  }
  return JsonResponse(404, util::ErrorBody("not found"));
}

} // namespace shakemap::http
