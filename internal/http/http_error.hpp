#pragma once

#include <exception>
#include <string_view>

#include "http_message.hpp"

namespace shakemap::http {

/*
  Converts internal exceptions into HTTP error responses.

  Every handler fault maps to 500 with {"error": what()}; the kind label
  only feeds logs and metrics.
*/

Response ToResponse(const std::exception& e);

std::string_view ErrorKind(const std::exception& e);

} // namespace shakemap::http
