#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/retrieval/passage.hpp"

namespace ragturn::retrieval {

inline constexpr double      kBm25K1           = 1.2;
inline constexpr double      kBm25B            = 0.75;
inline constexpr double      kTitleTermBoost   = 0.8;
inline constexpr double      kTitlePhraseBonus = 2.5;
inline constexpr double      kBodyPhraseBonus  = 1.2;
inline constexpr std::size_t kDefaultLimit     = 6;

// chunk_id -> score multiplier; absent ids score with 1.0
using MultiplierMap = std::unordered_map<std::string, double>;

struct RetrievalOptions {
  std::size_t limit = kDefaultLimit;

  std::shared_ptr<const MultiplierMap> multipliers;

  // Unset means every source. A set filter that matches no known source
  // returns nothing.
  std::optional<std::vector<std::string>> sources;
};

// Points into the index it was produced from; hold the index while using it.
struct RetrievalResult {
  const Passage*           passage = nullptr;
  double                   score   = 0.0;
  std::vector<std::string> matched_terms;
  std::string              snippet;
  double                   multiplier = 1.0;
};

/*
  RetrievalEngine

  Stateless BM25 ranking over an immutable CorpusIndex. Safe to call from
  any number of threads against the same index.
*/
class RetrievalEngine {
 public:
  explicit RetrievalEngine(std::shared_ptr<const CorpusIndex> index);

  std::vector<RetrievalResult> Retrieve(const std::string& query, const RetrievalOptions& options) const;

  const std::shared_ptr<const CorpusIndex>& index() const {
    return index_;
  }

 private:
  std::shared_ptr<const CorpusIndex> index_;
};

// Lowercased, trimmed, deduplicated sources that exist in `index`.
std::vector<std::string> ResolveSourceFilter(const CorpusIndex& index, const std::vector<std::string>& requested);

} // namespace ragturn::retrieval
