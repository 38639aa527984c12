#include "api_handlers.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

#include "http_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/shakemap_service.hpp"
#include "internal/util/json.hpp"

namespace shakemap::http {

namespace {

constexpr std::string_view kStaticPrefix = "/static/";

bool IsBlank(const std::string& body) {
  return body.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace

ApiHandlers::ApiHandlers(std::shared_ptr<service::ShakemapService> service, StaticFiles static_files, CorsPolicy cors)
    : service_(std::move(service)), static_files_(std::move(static_files)), cors_(std::move(cors)) {
  if (!service_) {
    throw std::invalid_argument("ApiHandlers requires a service");
  }
  RegisterRoutes();
}

void ApiHandlers::RegisterRoutes() {
  router_.Add("GET", "/", [this](const Request& r) { return Index(r); });
  router_.AddPrefix("GET", std::string(kStaticPrefix), [this](const Request& r) { return Static(r); });
  router_.Add("GET", "/api/run", [this](const Request& r) { return GetRun(r); });
  router_.Add("POST", "/api/run", [this](const Request& r) { return PostRun(r); });
  router_.Add("POST", "/api/refresh", [this](const Request& r) { return Refresh(r); });
  router_.Add("GET", "/api/cache_state", [this](const Request& r) { return CacheState(r); });
  router_.Add("POST", "/api/simulate", [this](const Request& r) { return Simulate(r); });
}

Response ApiHandlers::Handle(const Request& request) const {
  if (CorsPolicy::IsPreflight(request)) {
    return cors_.Preflight(request);
  }

  auto response = router_.Dispatch(request);
  cors_.Decorate(request, response);
  return response;
}

Response ApiHandlers::Guard(std::string_view route, const std::function<Response()>& body) const {
  observability::SpanScope span(route);
  observability::Stopwatch stopwatch;

  Response response;
  try {
    response = body();
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SHAKEMAP_LOG_ERROR("Request failed", {observability::StringField("route", route), observability::StringField("kind", ErrorKind(ex)),
                                          observability::StringField("error", ex.what())});
    response = ToResponse(ex);
  }

  span.SetAttribute("http.status_code", static_cast<std::int64_t>(response.status));
  observability::Metrics::Instance().RecordRequest(route, response.status);
  observability::Metrics::Instance().ObserveRequestLatencyMs(route, stopwatch.ElapsedMs());
  return response;
}

// ------------------------------------------------------------
// Routes
// ------------------------------------------------------------

Response ApiHandlers::Index(const Request&) const {
  return static_files_.Serve("index.html");
}

Response ApiHandlers::Static(const Request& request) const {
  return static_files_.Serve(std::string_view(request.path).substr(kStaticPrefix.size()));
}

Response ApiHandlers::GetRun(const Request&) const {
  return Guard("GET /api/run", [&] { return JsonResponse(200, util::ToJson(*service_->Run(false))); });
}

Response ApiHandlers::PostRun(const Request& request) const {
  return Guard("POST /api/run", [&] {
    const auto body = IsBlank(request.body) ? google::protobuf::Struct() : util::ParseObject(request.body);
    return JsonResponse(200, util::ToJson(*service_->Run(body)));
  });
}

Response ApiHandlers::Refresh(const Request&) const {
  return Guard("POST /api/refresh", [&] { return JsonResponse(200, util::ToJson(service_->Refresh())); });
}

Response ApiHandlers::CacheState(const Request&) const {
  return Guard("GET /api/cache_state", [&] { return JsonResponse(200, util::ToJson(service_->CacheState())); });
}

Response ApiHandlers::Simulate(const Request& request) const {
  return Guard("POST /api/simulate", [&] {
    if (IsBlank(request.body)) {
      return JsonResponse(200, util::ToJson(service_->Simulate(nullptr)));
    }
    const auto body = util::ParseObject(request.body);
    return JsonResponse(200, util::ToJson(service_->Simulate(&body)));
  });
}

} // namespace shakemap::http
