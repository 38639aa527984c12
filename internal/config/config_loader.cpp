#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace shakemap::config {

using shakemap::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress = "0.0.0.0:8000";
constexpr uint64_t    kDefaultMaxRequest  = 1 << 20;
constexpr uint32_t    kDefaultTimeoutMs   = 10000;
constexpr double      kDefaultHalfWidth   = 3.0;
constexpr double      kDefaultSpacing     = 0.1;

const char* const kDefaultOrigins[] = {
    "https://eqshakemap.pages.dev",
    "https://map.shakemap.org",
    "https://shakemap.org",
};

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;

  // an empty document means "all defaults"
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* server = config.mutable_server();
  if (server->bind_address().empty()) {
    server->set_bind_address(kDefaultBindAddress);
  }
  if (server->max_request_bytes() == 0) {
    server->set_max_request_bytes(kDefaultMaxRequest);
  }
  if (server->static_dir().empty()) {
    server->set_static_dir("static");
  }
  if (server->cors_allowed_origins().empty()) {
    for (const char* origin : kDefaultOrigins) {
      server->add_cors_allowed_origins(origin);
    }
  }

  auto* source = config.mutable_source();
  if (source->kind() == shakemap::runtime::config::SOURCE_KIND_UNSPECIFIED) {
    source->set_kind(source->url().empty() ? shakemap::runtime::config::SOURCE_KIND_FILE : shakemap::runtime::config::SOURCE_KIND_HTTP);
  }
  if (source->timeout_ms() == 0) {
    source->set_timeout_ms(kDefaultTimeoutMs);
  }
  if (!source->has_region()) {
    // Thailand and the surrounding seismic belt
    auto* region = source->mutable_region();
    region->set_min_lat(5.0);
    region->set_max_lat(21.0);
    region->set_min_lon(97.0);
    region->set_max_lon(106.0);
  }

  auto* overlay = config.mutable_overlay();
  if (overlay->half_width_deg() <= 0) {
    overlay->set_half_width_deg(kDefaultHalfWidth);
  }
  if (overlay->spacing_deg() <= 0) {
    overlay->set_spacing_deg(kDefaultSpacing);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.server().bind_address().find(':') == std::string::npos) {
    throw std::runtime_error("Invalid configuration: server.bind_address must be host:port");
  }

  const auto& source = config.source();
  if (source.kind() == shakemap::runtime::config::SOURCE_KIND_FILE && source.path().empty()) {
    throw std::runtime_error("Invalid configuration: source.path is required for SOURCE_KIND_FILE");
  }
  if (source.kind() == shakemap::runtime::config::SOURCE_KIND_HTTP && source.url().rfind("http://", 0) != 0) {
    throw std::runtime_error("Invalid configuration: source.url must start with http://");
  }

  const auto& region = source.region();
  if (region.min_lat() >= region.max_lat() || region.min_lon() >= region.max_lon()) {
    throw std::runtime_error("Invalid configuration: source.region is empty");
  }

  if (config.overlay().spacing_deg() > config.overlay().half_width_deg()) {
    throw std::runtime_error("Invalid configuration: overlay.spacing_deg exceeds overlay.half_width_deg");
  }
}

} // namespace shakemap::config
