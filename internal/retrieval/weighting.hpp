#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/db/model/retrieval_signal_record.hpp"
#include "internal/retrieval/retrieval_engine.hpp"

namespace ragturn::db {
class Repository;
}

namespace ragturn::retrieval {

inline constexpr double        kMaxMultiplier          = 1.2;
inline constexpr double        kMinMultiplier          = 0.7;
inline constexpr std::int64_t  kStrongSignalThreshold  = 8;
inline constexpr std::int64_t  kLightSignalThreshold   = 3;
inline constexpr std::uint64_t kDefaultSignalCacheTtlMs = 30000;

struct SignalInput {
  double       avg_rating        = 0.0;
  std::int64_t rating_count      = 0;
  std::int64_t low_rating_count  = 0;
  std::int64_t high_rating_count = 0;
};

struct SignalStats {
  std::int64_t rating_count      = 0;
  double       avg_rating        = 0.0;
  std::int64_t low_rating_count  = 0;
  std::int64_t high_rating_count = 0;
  double       confidence        = 0.0;
  double       multiplier        = 1.0;
};

/*
  Feedback-derived ranking multiplier.

  Average rating moves the score around a neutral 3.0, the share of low
  and high ratings nudges it further, and the whole adjustment is scaled
  by confidence (ratings / 8, halved under 3 ratings). The result stays
  within [0.7, 1.2]. Confidence and multiplier are rounded to 4 decimals.
*/
SignalStats CalculateRetrievalMultiplier(const SignalInput& input);

/*
  RetrievalWeights

  Read-through cache of chunk_id -> multiplier loaded from the
  retrieval_signals table. Entries older than the TTL are reloaded on the
  next call; RecordSignal and Invalidate drop the cache immediately.
*/
class RetrievalWeights {
 public:
  RetrievalWeights(std::shared_ptr<db::Repository> repo, std::uint64_t ttl_ms = kDefaultSignalCacheTtlMs);

  std::shared_ptr<const MultiplierMap> Multipliers();

  // Computes and stores the signal for one chunk.
  db::model::RetrievalSignalRecord RecordSignal(const std::string& chunk_id, const std::string& doc_id, const SignalInput& input);

  void Invalidate();

 private:
  std::shared_ptr<db::Repository> repo_;
  std::uint64_t                   ttl_ms_;

  std::mutex                           mutex_;
  std::shared_ptr<const MultiplierMap> cached_;
  std::uint64_t                        cached_at_ms_ = 0;
};

} // namespace ragturn::retrieval
