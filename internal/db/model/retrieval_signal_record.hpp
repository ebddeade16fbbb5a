#pragma once

#include <cstdint>
#include <string>

namespace ragturn::db::model {

// Aggregated feedback for one passage and the ranking multiplier derived from it.
struct RetrievalSignalRecord {
  std::string chunk_id;
  std::string doc_id;

  std::int64_t rating_count      = 0;
  double       avg_rating        = 0.0;
  std::int64_t low_rating_count  = 0;
  std::int64_t high_rating_count = 0;

  double confidence = 0.0;
  double multiplier = 1.0;

  std::uint64_t updated_at_ms = 0;
};

} // namespace ragturn::db::model
