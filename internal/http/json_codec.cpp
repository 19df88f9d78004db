#include "json_codec.hpp"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/util/json_util.h>

#include <cctype>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace debugpod::http {

namespace {

using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using google::protobuf::Reflection;
using google::protobuf::Value;

// InstanceStatus -> INSTANCE_STATUS_
std::string EnumPrefix(const std::string& type_name) {
  std::string prefix;
  for (std::size_t i = 0; i < type_name.size(); ++i) {
    const auto c = static_cast<unsigned char>(type_name[i]);
    if (i > 0 && std::isupper(c)) {
      prefix.push_back('_');
    }
    prefix.push_back(static_cast<char>(std::toupper(c)));
  }
  prefix.push_back('_');
  return prefix;
}

// index < 0 reads a singular field.
Value FieldValue(const Message& message, const FieldDescriptor* field, int index) {
  const Reflection* reflection = message.GetReflection();
  const bool        repeated   = index >= 0;

  Value out;
  switch (field->cpp_type()) {
    case FieldDescriptor::CPPTYPE_INT32:
      out.set_number_value(repeated ? reflection->GetRepeatedInt32(message, field, index) : reflection->GetInt32(message, field));
      break;
    case FieldDescriptor::CPPTYPE_INT64:
      out.set_number_value(static_cast<double>(repeated ? reflection->GetRepeatedInt64(message, field, index) : reflection->GetInt64(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_UINT32:
      out.set_number_value(repeated ? reflection->GetRepeatedUInt32(message, field, index) : reflection->GetUInt32(message, field));
      break;
    case FieldDescriptor::CPPTYPE_UINT64:
      out.set_number_value(static_cast<double>(repeated ? reflection->GetRepeatedUInt64(message, field, index) : reflection->GetUInt64(message, field)));
      break;
    case FieldDescriptor::CPPTYPE_DOUBLE:
      out.set_number_value(repeated ? reflection->GetRepeatedDouble(message, field, index) : reflection->GetDouble(message, field));
      break;
    case FieldDescriptor::CPPTYPE_FLOAT:
      out.set_number_value(repeated ? reflection->GetRepeatedFloat(message, field, index) : reflection->GetFloat(message, field));
      break;
    case FieldDescriptor::CPPTYPE_BOOL:
      out.set_bool_value(repeated ? reflection->GetRepeatedBool(message, field, index) : reflection->GetBool(message, field));
      break;
    case FieldDescriptor::CPPTYPE_STRING:
      out.set_string_value(repeated ? reflection->GetRepeatedString(message, field, index) : reflection->GetString(message, field));
      break;
    case FieldDescriptor::CPPTYPE_ENUM: {
      const auto number = repeated ? reflection->GetRepeatedEnumValue(message, field, index) : reflection->GetEnumValue(message, field);
      if (const auto* value = field->enum_type()->FindValueByNumber(number)) {
        out.set_string_value(EnumValueLabel(*value));
      } else {
        out.set_number_value(number);
      }
      break;
    }
    case FieldDescriptor::CPPTYPE_MESSAGE:
      out = ToValue(repeated ? reflection->GetRepeatedMessage(message, field, index) : reflection->GetMessage(message, field));
      break;
  }
  return out;
}

} // namespace

std::string EnumValueLabel(const google::protobuf::EnumValueDescriptor& value) {
  std::string name   = value.name();
  const auto  prefix = EnumPrefix(value.type()->name());
  if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
    name.erase(0, prefix.size());
  }

  std::string label;
  bool        word_start = true;
  for (char c : name) {
    if (c == '_') {
      word_start = true;
      continue;
    }
    const auto uc = static_cast<unsigned char>(c);
    label.push_back(static_cast<char>(word_start ? std::toupper(uc) : std::tolower(uc)));
    word_start = false;
  }
  return label;
}

Value ToValue(const Message& message) {
  const auto*       descriptor = message.GetDescriptor();
  const Reflection* reflection = message.GetReflection();

  Value out;
  auto* fields = out.mutable_struct_value()->mutable_fields();

  for (int i = 0; i < descriptor->field_count(); ++i) {
    const auto* field = descriptor->field(i);

    if (field->is_repeated()) {
      Value list;
      auto* values = list.mutable_list_value()->mutable_values();
      for (int j = 0; j < reflection->FieldSize(message, field); ++j) {
        *values->Add() = FieldValue(message, field, j);
      }
      (*fields)[field->name()] = std::move(list);
    } else if (field->cpp_type() == FieldDescriptor::CPPTYPE_MESSAGE && !reflection->HasField(message, field)) {
      continue;
    } else {
      (*fields)[field->name()] = FieldValue(message, field, -1);
    }
  }
  return out;
}

std::string ToJson(const Value& value) {
  std::string out;
  auto        status = google::protobuf::util::MessageToJsonString(value, &out);
  if (!status.ok()) {
    throw std::runtime_error("cannot encode JSON value: " + status.ToString());
  }
  return out;
}

std::string ToJson(const Message& message) {
  return ToJson(ToValue(message));
}

void FromJson(const std::string& body, google::protobuf::Message* message) {
  if (body.find_first_not_of(" \t\r\n") == std::string::npos) {
    return;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(body, message, options);
  if (!status.ok()) {
    throw debugpod::util::InvalidRequest("malformed request body: " + status.ToString());
  }
}

} // namespace debugpod::http
