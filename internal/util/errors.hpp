#pragma once

#include <stdexcept>
#include <string>

namespace shakemap::util {

/*
  Central error types.

  These get translated to HTTP error bodies at the handler boundary.
*/

// Event feed unreachable, malformed, or without a qualifying event.
class UpstreamFetchError : public std::runtime_error {
 public:
  explicit UpstreamFetchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Overlay computer or simulator rejected its input.
class ComputationError : public std::runtime_error {
 public:
  explicit ComputationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Missing or non-numeric request parameters.
class ParameterError : public std::runtime_error {
 public:
  explicit ParameterError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace shakemap::util
