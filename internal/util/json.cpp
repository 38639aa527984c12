#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "errors.hpp"

namespace shakemap::util {

namespace {

google::protobuf::util::JsonPrintOptions PrintOptions() {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;
  return options;
}

} // namespace

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, PrintOptions());
  if (!status.ok()) {
    throw std::runtime_error("failed to render JSON: " + std::string(status.message()));
  }
  return json;
}

google::protobuf::Value ToValue(const google::protobuf::Message& message) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(ToJson(message), &value);
  if (!status.ok()) {
    throw std::runtime_error("failed to convert message to JSON value: " + std::string(status.message()));
  }
  return value;
}

google::protobuf::Struct ParseObject(std::string_view json) {
  google::protobuf::Value value;
  auto                    status = google::protobuf::util::JsonStringToMessage(std::string(json), &value);
  if (!status.ok()) {
    throw ParameterError("invalid JSON body: " + std::string(status.message()));
  }
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    throw ParameterError("request body must be a JSON object");
  }
  return value.struct_value();
}

std::string ErrorBody(std::string_view message) {
  google::protobuf::Struct body;
  (*body.mutable_fields())["error"] = StringValue(message);
  return ToJson(body);
}

google::protobuf::Value NullValue() {
  google::protobuf::Value value;
  value.set_null_value(google::protobuf::NULL_VALUE);
  return value;
}

google::protobuf::Value StringValue(std::string_view value) {
  google::protobuf::Value out;
  out.set_string_value(std::string(value));
  return out;
}

google::protobuf::Value NumberValue(double value) {
  google::protobuf::Value out;
  out.set_number_value(value);
  return out;
}

google::protobuf::Value BoolValue(bool value) {
  google::protobuf::Value out;
  out.set_bool_value(value);
  return out;
}

} // namespace shakemap::util
