#include "internal/http/http_message.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace shakemap::http;

void TestParsesRequestFedInSlices() {
  const std::string raw =
      "POST /api/run?trace=1 HTTP/1.1\r\n"
      "Host: localhost:8000\r\n"
      "Content-Type: application/json\r\n"
      "Content-Length: 14\r\n"
      "\r\n"
      "{\"force\":true}";

  RequestParser parser(1024);
  for (std::size_t i = 0; i + 1 < raw.size(); i += 7) {
    const auto state = parser.Feed(std::string_view(raw).substr(i, std::min<std::size_t>(7, raw.size() - 1 - i)));
    assert(state == RequestParser::State::kIncomplete);
  }
  assert(parser.Feed(raw.substr(raw.size() - 1)) == RequestParser::State::kComplete);

  const auto& request = parser.request();
  assert(request.method == "POST");
  assert(request.target == "/api/run?trace=1");
  assert(request.path == "/api/run");
  assert(request.query == "trace=1");
  assert(request.version == "HTTP/1.1");
  assert(request.body == "{\"force\":true}");
  assert(request.Header("CONTENT-TYPE") && *request.Header("content-type") == "application/json");
  assert(!request.Header("origin"));
}

void TestRequestWithoutBodyCompletesAtHeadEnd() {
  RequestParser parser(1024);
  assert(parser.Feed("GET / HTTP/1.0\r\n\r\n") == RequestParser::State::kComplete);
  assert(parser.request().path == "/");
  assert(parser.request().body.empty());
}

void TestRejectsMalformedAndOversizedRequests() {
  {
    RequestParser parser(1024);
    assert(parser.Feed("GARBAGE\r\n\r\n") == RequestParser::State::kError);
    assert(parser.error_status() == 400);
  }
  {
    RequestParser parser(1024);
    assert(parser.Feed("GET / HTTP/1.1\r\nno-colon-here\r\n\r\n") == RequestParser::State::kError);
    assert(parser.error_status() == 400);
  }
  {
    RequestParser parser(1024);
    assert(parser.Feed("POST / HTTP/1.1\r\nContent-Length: abc\r\n\r\n") == RequestParser::State::kError);
    assert(parser.error_status() == 400);
  }
  {
    RequestParser parser(64);
    assert(parser.Feed("POST / HTTP/1.1\r\nContent-Length: 4096\r\n\r\n") == RequestParser::State::kError);
    assert(parser.error_status() == 413);
  }
  {
    RequestParser parser(1024);
    assert(parser.Feed("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n") == RequestParser::State::kError);
    assert(parser.error_status() == 501);
  }
}

void TestSerializeAddsFraming() {
  auto response = JsonResponse(404, R"({"error":"not found"})");
  response.SetHeader("content-type", "application/json; charset=utf-8");
  response.SetHeader("Content-Length", "999");

  const auto wire = Serialize(response);
  assert(wire.rfind("HTTP/1.1 404 Not Found\r\n", 0) == 0);
  assert(wire.find("Content-Length: 21\r\n") != std::string::npos);
  assert(wire.find("999") == std::string::npos);
  assert(wire.find("Connection: close\r\n\r\n{\"error\":\"not found\"}") != std::string::npos);
  assert(response.headers.size() == 2);
  assert(*response.Header("Content-Type") == "application/json; charset=utf-8");
}

void TestParsesClientResponses() {
  const auto plain = ParseResponse("HTTP/1.1 200 OK\r\nContent-Length: 5\r\nX-Test: a\r\n\r\nhello trailing");
  assert(plain.status == 200);
  assert(plain.body == "hello");
  assert(plain.headers.at("x-test") == "a");

  const auto chunked = ParseResponse("HTTP/1.1 503 Service Unavailable\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nbusy\r\n3;x=1\r\n!!!\r\n0\r\n\r\n");
  assert(chunked.status == 503);
  assert(chunked.body == "busy!!!");

  const auto until_close = ParseResponse("HTTP/1.0 200 OK\r\n\r\n{}");
  assert(until_close.body == "{}");

  bool threw = false;
  try {
    ParseResponse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestHugeChunkSizeIsTruncation() {
  bool threw = false;
  try {
    DecodeChunked("FFFFFFFFFFFFFFFE\r\n0\r\n\r\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    DecodeChunked("4\r\nbusy");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  assert(DecodeChunked("4\r\nbusy\r\n0\r\n\r\n") == "busy");
}

} // namespace

int main() {
  TestParsesRequestFedInSlices();
  TestRequestWithoutBodyCompletesAtHeadEnd();
  TestRejectsMalformedAndOversizedRequests();
  TestSerializeAddsFraming();
  TestParsesClientResponses();
  TestHugeChunkSizeIsTruncation();

  std::cout << "shakemap_unit_http_message: pass\n";
  return 0;
}
