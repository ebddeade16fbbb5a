#include "retrieval_engine.hpp"

#include <algorithm>
#include <cmath>
#include <unordered_set>

#include "internal/retrieval/text.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace ragturn::retrieval {

namespace {

std::vector<std::string> Dedupe(std::vector<std::string> terms) {
  std::unordered_set<std::string> seen;
  std::vector<std::string>        out;
  out.reserve(terms.size());
  for (auto& term : terms) {
    if (seen.insert(term).second) out.push_back(std::move(term));
  }
  return out;
}

double InverseDocumentFrequency(const CorpusIndex& index, const std::string& term) {
  const auto   it = index.doc_freq.find(term);
  const double df = it == index.doc_freq.end() ? 0.0 : static_cast<double>(it->second);
  const double n  = static_cast<double>(index.passage_count);
  return std::log(1.0 + (n - df + 0.5) / (df + 0.5));
}

} // namespace

std::vector<std::string> ResolveSourceFilter(const CorpusIndex& index, const std::vector<std::string>& requested) {
  std::vector<std::string> resolved;
  for (const auto& raw : requested) {
    auto source = util::ToLowerAscii(util::Trim(raw));
    if (source.empty() || index.sources.count(source) == 0) continue;
    if (std::find(resolved.begin(), resolved.end(), source) == resolved.end()) {
      resolved.push_back(std::move(source));
    }
  }
  return resolved;
}

RetrievalEngine::RetrievalEngine(std::shared_ptr<const CorpusIndex> index) : index_(std::move(index)) {
  if (!index_) {
    throw util::InvalidState("index_unavailable", "retrieval engine requires a built corpus index");
  }
}

std::vector<RetrievalResult> RetrievalEngine::Retrieve(const std::string& query, const RetrievalOptions& options) const {
  const auto trimmed = util::Trim(query);
  if (trimmed.empty() || options.limit == 0) return {};

  const auto terms = Dedupe(Tokenize(trimmed));
  if (terms.empty()) return {};

  std::unordered_set<std::string> allowed_sources;
  if (options.sources) {
    for (auto& source : ResolveSourceFilter(*index_, *options.sources)) {
      allowed_sources.insert(std::move(source));
    }
    if (allowed_sources.empty()) return {};
  }

  const auto query_lower = LowerCase(trimmed);

  // idf depends only on the term; compute once per query
  std::vector<double> idf;
  idf.reserve(terms.size());
  for (const auto& term : terms) idf.push_back(InverseDocumentFrequency(*index_, term));

  std::vector<RetrievalResult> scored;
  for (const auto& entry : index_->passages) {
    if (options.sources && allowed_sources.count(entry.passage.source) == 0) continue;

    double                   score = 0.0;
    std::vector<std::string> matched;
    for (std::size_t i = 0; i < terms.size(); ++i) {
      const auto tf_it = entry.term_freq.find(terms[i]);
      if (tf_it == entry.term_freq.end() || tf_it->second <= 0) continue;

      const double tf          = static_cast<double>(tf_it->second);
      const double length_norm = 1.0 - kBm25B + kBm25B * (static_cast<double>(entry.doc_length) / index_->avg_doc_length);
      score += idf[i] * (tf * (kBm25K1 + 1.0)) / (tf + kBm25K1 * length_norm);
      if (entry.title_terms.count(terms[i]) > 0) score += idf[i] * kTitleTermBoost;
      matched.push_back(terms[i]);
    }
    if (matched.empty()) continue;

    if (entry.searchable_title.find(query_lower) != std::string::npos) score += kTitlePhraseBonus;
    if (entry.searchable_text.find(query_lower) != std::string::npos) score += kBodyPhraseBonus;

    double multiplier = 1.0;
    if (options.multipliers) {
      const auto weight = options.multipliers->find(entry.passage.chunk_id);
      if (weight != options.multipliers->end() && std::isfinite(weight->second)) multiplier = weight->second;
    }

    RetrievalResult result;
    result.passage       = &entry.passage;
    result.score         = score * multiplier;
    result.matched_terms = std::move(matched);
    result.snippet       = BuildSnippet(entry.cleaned_text, terms);
    result.multiplier    = multiplier;
    scored.push_back(std::move(result));
  }

  std::stable_sort(scored.begin(), scored.end(), [](const RetrievalResult& a, const RetrievalResult& b) { return a.score > b.score; });

  // One passage per URL first, then backfill with the best of the rest.
  std::unordered_set<std::string> seen_urls;
  std::vector<RetrievalResult>    selected;
  std::vector<RetrievalResult>    fallback;
  for (auto& result : scored) {
    if (selected.size() < options.limit && seen_urls.insert(result.passage->url).second) {
      selected.push_back(std::move(result));
    } else {
      fallback.push_back(std::move(result));
    }
  }

  for (auto& result : fallback) {
    if (selected.size() >= options.limit) break;
    selected.push_back(std::move(result));
  }
  return selected;
}

} // namespace ragturn::retrieval
