#pragma once

#include <string>
#include <string_view>

#include "http_message.hpp"

namespace shakemap::http {

// Serves files below a root directory; ".." segments are refused.
class StaticFiles {
 public:
  explicit StaticFiles(std::string root);

  Response Serve(std::string_view relative_path) const;

  const std::string& root() const {
    return root_;
  }

 private:
  std::string root_;
};

std::string_view ContentTypeFor(std::string_view path);

} // namespace shakemap::http
