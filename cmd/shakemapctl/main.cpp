#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/http/http_client.hpp"
#include "internal/util/json.hpp"

using shakemap::http::ClientResponse;
using shakemap::http::HttpClient;

static constexpr std::chrono::milliseconds kTimeout{60000};

static void Usage() {
  std::cout << "Usage:\n"
            << "  shakemapctl <host:port> run [force]\n"
            << "  shakemapctl <host:port> refresh\n"
            << "  shakemapctl <host:port> state\n"
            << "  shakemapctl <host:port> simulate <lat> <lon> <depth_km> <mag>\n";
}

static int Print(const ClientResponse& resp) {
  std::cout << resp.body << "\n";
  return resp.status >= 200 && resp.status < 300 ? 0 : 1;
}

static int Post(const std::string& url, const std::string& body) {
  const std::map<std::string, std::string> headers{{"Content-Type", "application/json"}};
  return Print(HttpClient::Send("POST", url, body, kTimeout, headers));
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string base = "http://" + std::string(argv[1]);
  const std::string cmd  = argv[2];

  try {
    // ------------------------------------------------------------

    if (cmd == "run") {
      if (argc >= 4 && std::string(argv[3]) == "force") {
        return Post(base + "/api/run", R"({"force":true})");
      }
      return Print(HttpClient::Get(base + "/api/run", kTimeout));
    }

    // ------------------------------------------------------------

    if (cmd == "refresh") {
      return Post(base + "/api/refresh", "");
    }

    // ------------------------------------------------------------

    if (cmd == "state") {
      return Print(HttpClient::Get(base + "/api/cache_state", kTimeout));
    }

    // ------------------------------------------------------------

    if (cmd == "simulate") {
      if (argc < 7) {
        Usage();
        return 1;
      }

      // Values go through as strings; the server accepts numeric strings.
      google::protobuf::Struct body;
      auto&                    fields = *body.mutable_fields();
      fields["lat"]                   = shakemap::util::StringValue(argv[3]);
      fields["lon"]                   = shakemap::util::StringValue(argv[4]);
      fields["depth"]                 = shakemap::util::StringValue(argv[5]);
      fields["mag"]                   = shakemap::util::StringValue(argv[6]);
      return Post(base + "/api/simulate", shakemap::util::ToJson(body));
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
