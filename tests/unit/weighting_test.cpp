#include "internal/retrieval/weighting.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::retrieval;

bool Near(double a, double b) {
  return std::fabs(a - b) < 1e-9;
}

SignalInput Ratings(std::int64_t count, double avg, std::int64_t low, std::int64_t high) {
  SignalInput input;
  input.rating_count      = count;
  input.avg_rating        = avg;
  input.low_rating_count  = low;
  input.high_rating_count = high;
  return input;
}

void TestNoRatingsIsNeutral() {
  const auto stats = CalculateRetrievalMultiplier(Ratings(0, 4.5, 0, 0));
  assert(stats.multiplier == 1.0);
  assert(stats.confidence == 0.0);
}

void TestStrongSignalsAreClamped() {
  assert(Near(CalculateRetrievalMultiplier(Ratings(8, 5.0, 0, 8)).multiplier, kMaxMultiplier));
  assert(Near(CalculateRetrievalMultiplier(Ratings(8, 1.0, 8, 0)).multiplier, kMinMultiplier));
}

void TestLightSignalsAreDamped() {
  // confidence 2/8, halved below three ratings
  const auto stats = CalculateRetrievalMultiplier(Ratings(2, 4.0, 0, 1));
  assert(Near(stats.confidence, 0.125));
  assert(Near(stats.multiplier, 1.0175));
}

void TestMixedSignalRoundsToFourDecimals() {
  const auto stats = CalculateRetrievalMultiplier(Ratings(4, 3.0, 1, 1));
  assert(Near(stats.confidence, 0.5));
  assert(Near(stats.multiplier, 0.9875));
}

void TestOutOfRangeInputsAreClamped() {
  const auto stats = CalculateRetrievalMultiplier(Ratings(8, 9.0, -3, 20));
  assert(stats.avg_rating == 5.0);
  assert(stats.low_rating_count == 0);
  assert(stats.high_rating_count == 8);
  assert(stats.multiplier <= kMaxMultiplier);
}

void TestRecordSignalRefreshesMultipliers() {
  auto             repo = std::make_shared<ragturn::db::memory::MemoryRepository>();
  RetrievalWeights weights(repo, 60000);

  assert(weights.Multipliers()->empty());

  const auto record = weights.RecordSignal("sso#0", "sso", Ratings(8, 1.0, 8, 0));
  assert(record.chunk_id == "sso#0");
  assert(Near(record.multiplier, kMinMultiplier));

  const auto multipliers = weights.Multipliers();
  assert(multipliers->size() == 1);
  assert(Near(multipliers->at("sso#0"), kMinMultiplier));

  // upsert replaces the row for the same chunk
  (void)weights.RecordSignal("sso#0", "sso", Ratings(8, 5.0, 0, 8));
  assert(Near(weights.Multipliers()->at("sso#0"), kMaxMultiplier));
}

void TestCachedMapIsReusedUntilInvalidated() {
  auto             repo = std::make_shared<ragturn::db::memory::MemoryRepository>();
  RetrievalWeights weights(repo, 60000);

  const auto first = weights.Multipliers();
  assert(weights.Multipliers() == first);

  ragturn::db::model::RetrievalSignalRecord direct;
  direct.chunk_id   = "billing#0";
  direct.multiplier = 1.1;
  {
    auto tx = repo->Begin();
    ragturn::db::ThrowIfDbError(repo->UpsertRetrievalSignal(*tx, direct), "upsert");
    tx->Commit();
  }
  assert(weights.Multipliers()->empty());

  weights.Invalidate();
  assert(Near(weights.Multipliers()->at("billing#0"), 1.1));
}

void TestRecordSignalRequiresChunk() {
  RetrievalWeights weights(std::make_shared<ragturn::db::memory::MemoryRepository>());
  bool             threw = false;
  try {
    (void)weights.RecordSignal("", "doc", Ratings(1, 3.0, 0, 0));
  } catch (const ragturn::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestNoRatingsIsNeutral();
  TestStrongSignalsAreClamped();
  TestLightSignalsAreDamped();
  TestMixedSignalRoundsToFourDecimals();
  TestOutOfRangeInputsAreClamped();
  TestRecordSignalRefreshesMultipliers();
  TestCachedMapIsReusedUntilInvalidated();
  TestRecordSignalRequiresChunk();

  std::cout << "ragturn_unit_weighting: pass\n";
  return 0;
}
