#pragma once

#include <cstdint>
#include <string>

namespace ragturn::db::model {

struct CitationRecord {
  std::string message_id;
  int         rank = 0; // 1-based, matches the [n] markers in the answer

  std::string chunk_id;
  std::string doc_id;
  std::string url;
  std::string title;
  std::string section;

  double      score = 0.0;
  std::string snippet;
  double      multiplier = 1.0;
};

} // namespace ragturn::db::model
