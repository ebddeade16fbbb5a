#include "weighting.hpp"

#include <algorithm>
#include <cmath>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ragturn::retrieval {

namespace {

double Round4(double value) {
  return std::round(value * 10000.0) / 10000.0;
}

} // namespace

SignalStats CalculateRetrievalMultiplier(const SignalInput& input) {
  SignalStats stats;
  const auto  count = std::max<std::int64_t>(0, input.rating_count);
  if (count == 0) {
    return stats;
  }

  const double avg  = std::isfinite(input.avg_rating) ? std::clamp(input.avg_rating, 1.0, 5.0) : 1.0;
  const auto   low  = std::clamp<std::int64_t>(input.low_rating_count, 0, count);
  const auto   high = std::clamp<std::int64_t>(input.high_rating_count, 0, count);
  const double n    = static_cast<double>(count);

  double confidence = std::min(1.0, n / static_cast<double>(kStrongSignalThreshold));
  if (count < kLightSignalThreshold) confidence *= 0.5;

  const double from_avg   = ((avg - 3.0) / 2.0) * 0.2;
  const double low_share  = (static_cast<double>(low) / n) * 0.18;
  const double high_share = (static_cast<double>(high) / n) * 0.08;
  const double adjustment = (from_avg - low_share + high_share) * confidence;

  stats.rating_count      = count;
  stats.avg_rating        = avg;
  stats.low_rating_count  = low;
  stats.high_rating_count = high;
  stats.confidence        = Round4(confidence);
  stats.multiplier        = Round4(std::clamp(1.0 + adjustment, kMinMultiplier, kMaxMultiplier));
  return stats;
}

RetrievalWeights::RetrievalWeights(std::shared_ptr<db::Repository> repo, std::uint64_t ttl_ms) : repo_(std::move(repo)), ttl_ms_(ttl_ms) {
}

std::shared_ptr<const MultiplierMap> RetrievalWeights::Multipliers() {
  const auto now = static_cast<std::uint64_t>(util::NowMillis());
  {
    std::lock_guard lock(mutex_);
    if (cached_ && now - cached_at_ms_ <= ttl_ms_) return cached_;
  }

  auto map = std::make_shared<MultiplierMap>();
  {
    auto tx = repo_->Begin();
    for (const auto& signal : repo_->ListRetrievalSignals(*tx)) {
      (*map)[signal.chunk_id] = signal.multiplier;
    }
    tx->Commit();
  }

  std::lock_guard lock(mutex_);
  cached_       = map;
  cached_at_ms_ = now;
  return cached_;
}

db::model::RetrievalSignalRecord RetrievalWeights::RecordSignal(const std::string& chunk_id, const std::string& doc_id,
                                                                const SignalInput& input) {
  if (chunk_id.empty()) {
    throw util::InvalidArgument("missing_chunk_id", "chunk_id is required");
  }

  const auto stats = CalculateRetrievalMultiplier(input);

  db::model::RetrievalSignalRecord record;
  record.chunk_id          = chunk_id;
  record.doc_id            = doc_id;
  record.rating_count      = stats.rating_count;
  record.avg_rating        = stats.avg_rating;
  record.low_rating_count  = stats.low_rating_count;
  record.high_rating_count = stats.high_rating_count;
  record.confidence        = stats.confidence;
  record.multiplier        = stats.multiplier;
  record.updated_at_ms     = static_cast<std::uint64_t>(util::NowMillis());

  auto tx = repo_->Begin();
  db::ThrowIfDbError(repo_->UpsertRetrievalSignal(*tx, record), "upsert retrieval signal");
  tx->Commit();

  Invalidate();
  RAGTURN_LOG_INFO("retrieval signal updated", {observability::StringField("chunk_id", chunk_id),
                                                observability::IntField("rating_count", record.rating_count),
                                                observability::DoubleField("multiplier", record.multiplier)});
  return record;
}

void RetrievalWeights::Invalidate() {
  std::lock_guard lock(mutex_);
  cached_.reset();
  cached_at_ms_ = 0;
}

} // namespace ragturn::retrieval
