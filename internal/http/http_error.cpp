#include "http_error.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace shakemap::http {

std::string_view ErrorKind(const std::exception& e) {
  using namespace shakemap::util;

  if (dynamic_cast<const UpstreamFetchError*>(&e)) {
    return "upstream";
  }
  if (dynamic_cast<const ComputationError*>(&e)) {
    return "computation";
  }
  if (dynamic_cast<const ParameterError*>(&e)) {
    return "parameter";
  }
  return "internal";
}

Response ToResponse(const std::exception& e) {
  return JsonResponse(500, util::ErrorBody(e.what()));
}

} // namespace shakemap::http
