#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ragturn::util {

std::string Trim(std::string_view value);
std::string ToLowerAscii(std::string_view value);

// Splits on a single character; empty pieces are kept.
std::vector<std::string> Split(std::string_view value, char separator);

bool IsBlank(std::string_view value);

} // namespace ragturn::util
