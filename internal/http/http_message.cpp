#include "http_message.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace shakemap::http {

namespace {

constexpr std::string_view kCrlf       = "\r\n";
constexpr std::string_view kHeadEnd    = "\r\n\r\n";
constexpr std::size_t      kMaxHeaders = 100;

std::string_view Trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

bool ParseSize(std::string_view s, std::size_t base, std::size_t& out) {
  if (s.empty()) return false;
  std::size_t value = 0;
  for (char c : s) {
    int digit = -1;
    if (c >= '0' && c <= '9') digit = c - '0';
    else if (base == 16 && c >= 'a' && c <= 'f') digit = 10 + (c - 'a');
    else if (base == 16 && c >= 'A' && c <= 'F') digit = 10 + (c - 'A');
    if (digit < 0) return false;
    if (value > (static_cast<std::size_t>(-1) - digit) / base) return false;
    value = value * base + static_cast<std::size_t>(digit);
  }
  out = value;
  return true;
}

// Splits "Name: value" lines into lower-cased names. Returns false on a
// line without a colon.
bool ParseHeaderLines(std::string_view block, std::map<std::string, std::string>& headers) {
  std::size_t pos = 0;
  std::size_t count = 0;
  while (pos < block.size()) {
    auto eol = block.find(kCrlf, pos);
    if (eol == std::string_view::npos) eol = block.size();
    const auto line = block.substr(pos, eol - pos);
    pos             = eol + kCrlf.size();
    if (line.empty()) continue;

    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return false;
    if (++count > kMaxHeaders) return false;

    auto  name  = ToLower(Trim(line.substr(0, colon)));
    auto  value = std::string(Trim(line.substr(colon + 1)));
    auto& slot  = headers[name];
    slot        = slot.empty() ? value : slot + ", " + value;
  }
  return true;
}

} // namespace

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const std::string* Request::Header(std::string_view name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? nullptr : &it->second;
}

void Response::SetHeader(std::string name, std::string value) {
  const auto lowered = ToLower(name);
  for (auto& [existing, existing_value] : headers) {
    if (ToLower(existing) == lowered) {
      existing_value = std::move(value);
      return;
    }
  }
  headers.emplace_back(std::move(name), std::move(value));
}

const std::string* Response::Header(std::string_view name) const {
  const auto lowered = ToLower(name);
  for (const auto& [existing, value] : headers) {
    if (ToLower(existing) == lowered) return &value;
  }
  return nullptr;
}

Response JsonResponse(int status, std::string body) {
  return ContentResponse(status, std::move(body), "application/json");
}

Response ContentResponse(int status, std::string body, std::string content_type) {
  Response response;
  response.status = status;
  response.body   = std::move(body);
  response.SetHeader("Content-Type", std::move(content_type));
  return response;
}

std::string_view ReasonPhrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 413: return "Payload Too Large";
    case 500: return "Internal Server Error";
    case 501: return "Not Implemented";
    case 503: return "Service Unavailable";
    default: return "Unknown";
  }
}

std::string Serialize(const Response& response) {
  std::string out;
  out.reserve(response.body.size() + 256);
  out += "HTTP/1.1 ";
  out += std::to_string(response.status);
  out += ' ';
  out += ReasonPhrase(response.status);
  out += kCrlf;
  for (const auto& [name, value] : response.headers) {
    const auto lowered = ToLower(name);
    if (lowered == "content-length" || lowered == "connection") continue;
    out += name;
    out += ": ";
    out += value;
    out += kCrlf;
  }
  out += "Content-Length: " + std::to_string(response.body.size());
  out += kCrlf;
  out += "Connection: close";
  out += kHeadEnd;
  out += response.body;
  return out;
}

// ------------------------------------------------------------
// RequestParser
// ------------------------------------------------------------

RequestParser::RequestParser(std::size_t max_bytes) : max_bytes_(max_bytes) {
}

RequestParser::State RequestParser::Fail(int status, std::string message) {
  state_        = State::kError;
  error_status_ = status;
  error_        = std::move(message);
  return state_;
}

RequestParser::State RequestParser::Feed(std::string_view data) {
  if (state_ != State::kIncomplete) return state_;

  buffer_.append(data);
  if (buffer_.size() > max_bytes_) {
    return Fail(413, "request exceeds " + std::to_string(max_bytes_) + " bytes");
  }

  if (!head_parsed_) {
    const auto head_end = buffer_.find(kHeadEnd);
    if (head_end == std::string::npos) return state_;
    if (ParseHead(head_end) == State::kError) return state_;
  }
  return TryFinish();
}

RequestParser::State RequestParser::ParseHead(std::size_t head_end) {
  const std::string_view head(buffer_.data(), head_end);
  const auto             line_end     = head.find(kCrlf);
  const auto             request_line = head.substr(0, line_end);

  const auto sp1 = request_line.find(' ');
  const auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
  if (sp1 == std::string_view::npos || sp2 == std::string_view::npos) {
    return Fail(400, "malformed request line");
  }

  request_.method  = std::string(request_line.substr(0, sp1));
  request_.target  = std::string(request_line.substr(sp1 + 1, sp2 - sp1 - 1));
  request_.version = std::string(request_line.substr(sp2 + 1));
  if (request_.method.empty() || request_.target.empty() || request_.version.rfind("HTTP/1.", 0) != 0) {
    return Fail(400, "malformed request line");
  }

  const auto question = request_.target.find('?');
  request_.path       = request_.target.substr(0, question);
  request_.query      = question == std::string::npos ? "" : request_.target.substr(question + 1);

  if (line_end != std::string_view::npos && !ParseHeaderLines(head.substr(line_end + kCrlf.size()), request_.headers)) {
    return Fail(400, "malformed header line");
  }

  if (request_.Header("transfer-encoding")) {
    return Fail(501, "chunked request bodies are not supported");
  }
  if (const auto* length = request_.Header("content-length")) {
    if (!ParseSize(*length, 10, content_length_)) {
      return Fail(400, "invalid Content-Length");
    }
  }

  body_offset_ = head_end + kHeadEnd.size();
  if (content_length_ > max_bytes_ - std::min(max_bytes_, body_offset_)) {
    return Fail(413, "request exceeds " + std::to_string(max_bytes_) + " bytes");
  }

  head_parsed_ = true;
  return state_;
}

RequestParser::State RequestParser::TryFinish() {
  if (buffer_.size() - body_offset_ < content_length_) return state_;

  request_.body = buffer_.substr(body_offset_, content_length_);
  state_        = State::kComplete;
  return state_;
}

// ------------------------------------------------------------
// Client side
// ------------------------------------------------------------

std::string DecodeChunked(std::string_view body) {
  std::string out;
  std::size_t pos = 0;
  while (true) {
    const auto eol = body.find(kCrlf, pos);
    if (eol == std::string_view::npos) throw std::runtime_error("truncated chunk header");

    auto size_field = body.substr(pos, eol - pos);
    if (auto ext = size_field.find(';'); ext != std::string_view::npos) size_field = size_field.substr(0, ext);

    std::size_t size = 0;
    if (!ParseSize(Trim(size_field), 16, size)) throw std::runtime_error("invalid chunk size");

    pos = eol + kCrlf.size();
    if (size == 0) return out;
    if (size > body.size() - pos || body.size() - pos - size < kCrlf.size()) throw std::runtime_error("truncated chunk");

    out.append(body.substr(pos, size));
    pos += size + kCrlf.size();
  }
}

ClientResponse ParseResponse(std::string_view raw) {
  const auto head_end = raw.find(kHeadEnd);
  if (head_end == std::string_view::npos) throw std::runtime_error("incomplete response head");

  const auto head        = raw.substr(0, head_end);
  const auto line_end    = head.find(kCrlf);
  const auto status_line = head.substr(0, line_end);

  const auto sp = status_line.find(' ');
  if (status_line.rfind("HTTP/1.", 0) != 0 || sp == std::string_view::npos) {
    throw std::runtime_error("malformed status line");
  }

  std::size_t status = 0;
  if (!ParseSize(status_line.substr(sp + 1, 3), 10, status)) throw std::runtime_error("malformed status code");

  ClientResponse response;
  response.status = static_cast<int>(status);
  if (line_end != std::string_view::npos && !ParseHeaderLines(head.substr(line_end + kCrlf.size()), response.headers)) {
    throw std::runtime_error("malformed response header");
  }

  auto body = raw.substr(head_end + kHeadEnd.size());
  if (auto it = response.headers.find("transfer-encoding"); it != response.headers.end() && ToLower(it->second).find("chunked") != std::string::npos) {
    response.body = DecodeChunked(body);
    return response;
  }
  if (auto it = response.headers.find("content-length"); it != response.headers.end()) {
    std::size_t length = 0;
    if (!ParseSize(it->second, 10, length) || length > body.size()) throw std::runtime_error("truncated response body");
    body = body.substr(0, length);
  }
  response.body = std::string(body);
  return response;
}

} // namespace shakemap::http
