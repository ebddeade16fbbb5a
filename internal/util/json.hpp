#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

namespace ragturn::util {

/*
  Free-form metadata attached to ledger entries, usage records and audit
  events. Built as a protobuf Struct and stored as JSON text.
*/
using JsonObject = google::protobuf::Struct;

void SetString(JsonObject& object, std::string_view key, std::string_view value);
void SetNumber(JsonObject& object, std::string_view key, double value);
void SetInt(JsonObject& object, std::string_view key, std::int64_t value);
void SetBool(JsonObject& object, std::string_view key, bool value);
void SetNull(JsonObject& object, std::string_view key);

// Copies every field of `from` into `into`, overwriting existing keys.
void Merge(JsonObject& into, const JsonObject& from);

std::string ToJson(const JsonObject& object);
JsonObject  ParseJsonObject(const std::string& json);

} // namespace ragturn::util
