#include "json.hpp"

#include <google/protobuf/util/json_util.h>

#include "internal/util/errors.hpp"

namespace ragturn::util {

namespace {

google::protobuf::Value& Field(JsonObject& object, std::string_view key) {
  return (*object.mutable_fields())[std::string(key)];
}

} // namespace

void SetString(JsonObject& object, std::string_view key, std::string_view value) {
  Field(object, key).set_string_value(std::string(value));
}

void SetNumber(JsonObject& object, std::string_view key, double value) {
  Field(object, key).set_number_value(value);
}

void SetInt(JsonObject& object, std::string_view key, std::int64_t value) {
  Field(object, key).set_number_value(static_cast<double>(value));
}

void SetBool(JsonObject& object, std::string_view key, bool value) {
  Field(object, key).set_bool_value(value);
}

void SetNull(JsonObject& object, std::string_view key) {
  Field(object, key).set_null_value(google::protobuf::NULL_VALUE);
}

void Merge(JsonObject& into, const JsonObject& from) {
  for (const auto& [key, value] : from.fields()) {
    (*into.mutable_fields())[key] = value;
  }
}

std::string ToJson(const JsonObject& object) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(object, &json);
  if (!status.ok()) {
    throw InvalidArgument("invalid_metadata", "Failed to serialize metadata: " + std::string(status.message()));
  }
  return json;
}

JsonObject ParseJsonObject(const std::string& json) {
  JsonObject object;
  if (json.empty()) {
    return object;
  }
  auto status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (!status.ok()) {
    throw InvalidArgument("invalid_metadata", "Failed to parse metadata: " + std::string(status.message()));
  }
  return object;
}

} // namespace ragturn::util
