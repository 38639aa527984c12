#include "static_files.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

#include "internal/util/json.hpp"

namespace shakemap::http {

namespace {

bool HasParentSegment(std::string_view path) {
  std::size_t start = 0;
  while (start <= path.size()) {
    auto end = path.find('/', start);
    if (end == std::string_view::npos) end = path.size();
    if (path.substr(start, end - start) == "..") return true;
    start = end + 1;
  }
  return false;
}

Response NotFound() {
  return JsonResponse(404, util::ErrorBody("not found"));
}

} // namespace

std::string_view ContentTypeFor(std::string_view path) {
  const auto dot = path.rfind('.');
  if (dot == std::string_view::npos) return "application/octet-stream";

  const auto ext = path.substr(dot + 1);
  if (ext == "html" || ext == "htm") return "text/html; charset=utf-8";
  if (ext == "css") return "text/css; charset=utf-8";
  if (ext == "js") return "text/javascript; charset=utf-8";
  if (ext == "json" || ext == "geojson") return "application/json";
  if (ext == "png") return "image/png";
  if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
  if (ext == "svg") return "image/svg+xml";
  if (ext == "ico") return "image/x-icon";
  if (ext == "txt") return "text/plain; charset=utf-8";
  return "application/octet-stream";
}

StaticFiles::StaticFiles(std::string root) : root_(std::move(root)) {
}

Response StaticFiles::Serve(std::string_view relative_path) const {
  while (!relative_path.empty() && relative_path.front() == '/') relative_path.remove_prefix(1);
  if (relative_path.empty() || HasParentSegment(relative_path)) {
    return NotFound();
  }

  const auto      path = std::filesystem::path(root_) / std::string(relative_path);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return NotFound();
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return NotFound();
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();

  return ContentResponse(200, buffer.str(), std::string(ContentTypeFor(relative_path)));
}

} // namespace shakemap::http
