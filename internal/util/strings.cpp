#include "strings.hpp"

#include <cctype>

namespace ragturn::util {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

std::string Trim(std::string_view value) {
  std::size_t begin = 0;
  std::size_t end   = value.size();
  while (begin < end && IsSpace(value[begin])) ++begin;
  while (end > begin && IsSpace(value[end - 1])) --end;
  return std::string(value.substr(begin, end - begin));
}

std::string ToLowerAscii(std::string_view value) {
  std::string out(value);
  for (auto& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

std::vector<std::string> Split(std::string_view value, char separator) {
  std::vector<std::string> parts;
  std::size_t              start = 0;
  for (;;) {
    const auto pos = value.find(separator, start);
    if (pos == std::string_view::npos) {
      parts.emplace_back(value.substr(start));
      return parts;
    }
    parts.emplace_back(value.substr(start, pos - start));
    start = pos + 1;
  }
}

bool IsBlank(std::string_view value) {
  for (char c : value) {
    if (!IsSpace(c)) return false;
  }
  return true;
}

} // namespace ragturn::util
