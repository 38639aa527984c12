#include "request_params.hpp"

#include <cerrno>
#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace shakemap::service {

namespace {

bool IsSpace(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

bool ParseNumber(const std::string& text, double& out) {
  std::size_t begin = 0;
  std::size_t end   = text.size();
  while (begin < end && IsSpace(text[begin])) ++begin;
  while (end > begin && IsSpace(text[end - 1])) --end;
  if (begin == end) {
    return false;
  }

  const std::string trimmed    = text.substr(begin, end - begin);
  char*             parsed_end = nullptr;
  errno                        = 0;
  const double value           = std::strtod(trimmed.c_str(), &parsed_end);
  if (parsed_end != trimmed.c_str() + trimmed.size() || errno == ERANGE) {
    return false;
  }
  out = value;
  return true;
}

double NumberField(const google::protobuf::Struct& body, const std::string& key) {
  const auto it = body.fields().find(key);
  if (it == body.fields().end() || it->second.kind_case() == google::protobuf::Value::kNullValue) {
    throw util::ParameterError("missing parameter: " + key);
  }

  const auto& value = it->second;
  switch (value.kind_case()) {
    case google::protobuf::Value::kNumberValue:
      return value.number_value();
    case google::protobuf::Value::kBoolValue:
      return value.bool_value() ? 1.0 : 0.0;
    case google::protobuf::Value::kStringValue: {
      double parsed = 0;
      if (ParseNumber(value.string_value(), parsed)) {
        return parsed;
      }
      break;
    }
    default:
      break;
  }
  throw util::ParameterError("invalid parameter: " + key + " must be a number");
}

} // namespace

overlay::SimulationParams ParseSimulationParams(const google::protobuf::Struct& body) {
  overlay::SimulationParams params;
  params.lat      = NumberField(body, "lat");
  params.lon      = NumberField(body, "lon");
  params.depth_km = NumberField(body, "depth");
  params.mag      = NumberField(body, "mag");
  return params;
}

bool IsTruthy(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kBoolValue:
      return value.bool_value();
    case google::protobuf::Value::kNumberValue:
      return value.number_value() != 0.0;
    case google::protobuf::Value::kStringValue:
      return !value.string_value().empty();
    case google::protobuf::Value::kListValue:
      return value.list_value().values_size() > 0;
    case google::protobuf::Value::kStructValue:
      return value.struct_value().fields_size() > 0;
    default:
      return false;
  }
}

bool FlagField(const google::protobuf::Struct& body, std::string_view key) {
  const auto it = body.fields().find(std::string(key));
  return it != body.fields().end() && IsTruthy(it->second);
}

} // namespace shakemap::service
