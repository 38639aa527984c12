#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace shakemap::http {

struct Request {
  std::string method;
  std::string target;
  std::string path;
  std::string query;
  std::string version;

  // names are lower-cased
  std::map<std::string, std::string> headers;
  std::string                        body;

  const std::string* Header(std::string_view name) const;
};

struct Response {
  int                                              status{200};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;

  // Replaces an existing header of the same name (case-insensitive).
  void               SetHeader(std::string name, std::string value);
  const std::string* Header(std::string_view name) const;
};

Response JsonResponse(int status, std::string body);
Response ContentResponse(int status, std::string body, std::string content_type);

std::string_view ReasonPhrase(int status);

// Status line, headers, Content-Length and Connection: close, then body.
std::string Serialize(const Response& response);

std::string ToLower(std::string_view value);

/*
  Incremental HTTP/1.1 request parser.

  Feed() accepts arbitrary slices of the byte stream. Requests must
  frame their body with Content-Length; chunked request bodies are
  rejected. Anything larger than max_bytes (head plus body) fails with
  status 413.
*/
class RequestParser {
 public:
  enum class State { kIncomplete, kComplete, kError };

  explicit RequestParser(std::size_t max_bytes);

  State Feed(std::string_view data);

  State state() const {
    return state_;
  }

  const Request& request() const {
    return request_;
  }

  int error_status() const {
    return error_status_;
  }

  const std::string& error() const {
    return error_;
  }

 private:
  State Fail(int status, std::string message);
  State ParseHead(std::size_t head_end);
  State TryFinish();

  std::size_t max_bytes_;
  std::string buffer_;
  bool        head_parsed_{false};
  std::size_t body_offset_{0};
  std::size_t content_length_{0};

  State       state_{State::kIncomplete};
  Request     request_;
  int         error_status_{400};
  std::string error_;
};

struct ClientResponse {
  int                                status{0};
  std::map<std::string, std::string> headers;
  std::string                        body;
};

// Parses a complete response read until connection close. Throws
// std::runtime_error on malformed input.
ClientResponse ParseResponse(std::string_view raw);

std::string DecodeChunked(std::string_view body);

} // namespace shakemap::http
