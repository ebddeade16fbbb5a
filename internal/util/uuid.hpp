#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace ragturn::util {

/*
  UUID helpers

  Request ids, message ids and credential ids are RFC4122 v4 UUIDs in their
  canonical 36 character text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

// GenerateUUID() rendered as text.
std::string NewId();

} // namespace ragturn::util
