#pragma once

#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/overlay/simulator.hpp"

namespace shakemap::service {

// Reads lat, lon, depth and mag. Numbers, booleans and numeric strings
// are accepted; a missing or non-numeric field throws util::ParameterError.
overlay::SimulationParams ParseSimulationParams(const google::protobuf::Struct& body);

// Loose truthiness: null, false, 0, "" and empty containers are false.
bool IsTruthy(const google::protobuf::Value& value);

// body[key] when present, false otherwise.
bool FlagField(const google::protobuf::Struct& body, std::string_view key);

} // namespace shakemap::service
