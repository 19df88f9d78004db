#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>

#include <string>

namespace debugpod::http {

/*
  Response encoding for the HTTP surface.

  Field names are the proto names and defaults are printed. Unlike the
  stock protobuf mapping, 64-bit integers stay JSON numbers and enum
  values drop their type prefix: INSTANCE_STATUS_RUNNING is "Running".
*/
google::protobuf::Value ToValue(const google::protobuf::Message& message);

std::string ToJson(const google::protobuf::Value& value);
std::string ToJson(const google::protobuf::Message& message);

// "INSTANCE_STATUS_DRAINING" of InstanceStatus -> "Draining".
std::string EnumValueLabel(const google::protobuf::EnumValueDescriptor& value);

// Throws util::InvalidRequest on malformed JSON or unknown fields. An empty
// body leaves the message at its defaults.
void FromJson(const std::string& body, google::protobuf::Message* message);

} // namespace debugpod::http
