#pragma once

#include <functional>
#include <string>
#include <vector>

#include "http_message.hpp"

namespace shakemap::http {

/*
  Method + path dispatch. Exact routes win over prefix routes; a path
  known under another method answers 405 with an Allow header, anything
  else 404.
*/
class Router {
 public:
  using Handler = std::function<Response(const Request&)>;

  void Add(std::string method, std::string path, Handler handler);

  // Matches every path starting with prefix.
  void AddPrefix(std::string method, std::string prefix, Handler handler);

  Response Dispatch(const Request& request) const;

 private:
  struct Route {
    std::string method;
    std::string path;
    bool        prefix{false};
    Handler     handler;

    bool Matches(const std::string& request_path) const;
  };

  std::vector<Route> routes_;
};

} // namespace shakemap::http
