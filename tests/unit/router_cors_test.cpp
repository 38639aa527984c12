#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/http/cors.hpp"
#include "internal/http/http_error.hpp"
#include "internal/http/router.hpp"
#include "internal/http/static_files.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace shakemap::http;

Request MakeRequest(std::string method, std::string path) {
  Request request;
  request.method  = std::move(method);
  request.path    = path;
  request.target  = std::move(path);
  request.version = "HTTP/1.1";
  return request;
}

Router MakeRouter() {
  Router router;
  router.Add("GET", "/api/run", [](const Request&) { return JsonResponse(200, "\"get\""); });
  router.Add("POST", "/api/run", [](const Request&) { return JsonResponse(200, "\"post\""); });
  router.AddPrefix("GET", "/static/", [](const Request& r) { return ContentResponse(200, r.path, "text/plain"); });
  return router;
}

void TestDispatchByMethodAndPath() {
  const auto router = MakeRouter();
  assert(router.Dispatch(MakeRequest("GET", "/api/run")).body == "\"get\"");
  assert(router.Dispatch(MakeRequest("POST", "/api/run")).body == "\"post\"");
  assert(router.Dispatch(MakeRequest("GET", "/static/css/app.css")).body == "/static/css/app.css");
}

void TestUnknownPathAndWrongMethod() {
  const auto router = MakeRouter();

  const auto missing = router.Dispatch(MakeRequest("GET", "/api/nope"));
  assert(missing.status == 404);
  assert(missing.body == R"({"error":"not found"})");

  const auto wrong_method = router.Dispatch(MakeRequest("DELETE", "/api/run"));
  assert(wrong_method.status == 405);
  assert(*wrong_method.Header("Allow") == "GET, POST");
}

void TestCorsAllowedOrigin() {
  CorsPolicy policy(std::vector<std::string>{"https://shakemap.org"});

  auto request = MakeRequest("GET", "/api/cache_state");
  request.headers["origin"] = "https://shakemap.org";
  auto response             = JsonResponse(200, "{}");
  policy.Decorate(request, response);
  assert(*response.Header("Access-Control-Allow-Origin") == "https://shakemap.org");
  assert(*response.Header("Access-Control-Allow-Credentials") == "true");
  assert(*response.Header("Vary") == "Origin");

  request.headers["origin"] = "https://evil.example";
  auto other                = JsonResponse(200, "{}");
  policy.Decorate(request, other);
  assert(!other.Header("Access-Control-Allow-Origin"));
}

void TestCorsPreflight() {
  CorsPolicy policy(std::vector<std::string>{"https://map.shakemap.org"});

  auto request = MakeRequest("OPTIONS", "/api/run");
  assert(!CorsPolicy::IsPreflight(request));
  request.headers["origin"]                         = "https://map.shakemap.org";
  request.headers["access-control-request-method"]  = "POST";
  request.headers["access-control-request-headers"] = "content-type";
  assert(CorsPolicy::IsPreflight(request));

  const auto allowed = policy.Preflight(request);
  assert(allowed.status == 200);
  assert(*allowed.Header("Access-Control-Allow-Origin") == "https://map.shakemap.org");
  assert(allowed.Header("Access-Control-Allow-Methods")->find("POST") != std::string::npos);
  assert(*allowed.Header("Access-Control-Allow-Headers") == "content-type");
  assert(*allowed.Header("Access-Control-Max-Age") == "600");

  request.headers["origin"] = "https://evil.example";
  const auto denied         = policy.Preflight(request);
  assert(denied.status == 400);
  assert(denied.body == "Disallowed CORS origin");
  assert(!denied.Header("Access-Control-Allow-Origin"));
}

void TestStaticFiles() {
  const auto root = std::filesystem::temp_directory_path() / "shakemap_static_files_test";
  std::filesystem::create_directories(root / "css");
  std::ofstream(root / "index.html") << "<html></html>";
  std::ofstream(root / "css" / "app.css") << "body{}";

  StaticFiles files(root.string());
  const auto  index = files.Serve("index.html");
  assert(index.status == 200);
  assert(index.body == "<html></html>");
  assert(*index.Header("Content-Type") == "text/html; charset=utf-8");

  const auto css = files.Serve("/css/app.css");
  assert(css.status == 200);
  assert(*css.Header("Content-Type") == "text/css; charset=utf-8");

  assert(files.Serve("../etc/passwd").status == 404);
  assert(files.Serve("css/../index.html").status == 404);
  assert(files.Serve("missing.js").status == 404);
  assert(files.Serve("css").status == 404);
}

void TestErrorMapping() {
  const shakemap::util::ParameterError parameter("missing parameter: mag");
  const auto                           response = ToResponse(parameter);
  assert(response.status == 500);
  assert(response.body == R"({"error":"missing parameter: mag"})");
  assert(ErrorKind(parameter) == "parameter");
  assert(ErrorKind(shakemap::util::UpstreamFetchError("x")) == "upstream");
  assert(ErrorKind(shakemap::util::ComputationError("x")) == "computation");
  assert(ErrorKind(std::runtime_error("x")) == "internal");
}

} // namespace

int main() {
  TestDispatchByMethodAndPath();
  TestUnknownPathAndWrongMethod();
  TestCorsAllowedOrigin();
  TestCorsPreflight();
  TestStaticFiles();
  TestErrorMapping();

  std::cout << "shakemap_unit_router_cors: pass\n";
  return 0;
}
