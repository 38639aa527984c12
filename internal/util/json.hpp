#pragma once

#include <string>
#include <string_view>

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

namespace shakemap::util {

/*
  JSON helpers on top of protobuf json_util. Messages render with their
  proto field names and with default-valued scalars included.
*/

std::string ToJson(const google::protobuf::Message& message);

google::protobuf::Value ToValue(const google::protobuf::Message& message);

// Parses a JSON object body. Throws util::ParameterError when the text
// is not valid JSON or not an object.
google::protobuf::Struct ParseObject(std::string_view json);

// {"error": "<message>"}
std::string ErrorBody(std::string_view message);

google::protobuf::Value NullValue();
google::protobuf::Value StringValue(std::string_view value);
google::protobuf::Value NumberValue(double value);
google::protobuf::Value BoolValue(bool value);

} // namespace shakemap::util
