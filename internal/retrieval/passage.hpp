#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace ragturn::retrieval {

// One corpus unit as loaded from disk. Immutable once indexed.
struct Passage {
  std::string                chunk_id;
  std::string                doc_id;
  std::string                url;
  std::string                title;
  std::optional<std::string> section;
  std::vector<std::string>   heading_path;
  std::string                text;
  std::string                source; // resolved, never empty
  std::string                source_host;
  std::optional<double>      tokens_estimate;
};

struct IndexedPassage {
  Passage passage;

  std::string                          cleaned_text;
  std::unordered_map<std::string, int> term_freq;
  int                                  doc_length = 1;
  std::unordered_set<std::string>      title_terms;

  // lowercased copies for whole-query substring checks
  std::string searchable_title;
  std::string searchable_text;
};

struct SourceStats {
  std::size_t documents = 0;
  std::size_t chunks    = 0;
};

/*
  Read-only after build; shared between queries as
  std::shared_ptr<const CorpusIndex>.
*/
struct CorpusIndex {
  std::vector<IndexedPassage>          passages;
  std::unordered_map<std::string, int> doc_freq;
  double                               avg_doc_length = 1.0;

  std::size_t passage_count  = 0;
  std::size_t document_count = 0;
  std::size_t skipped_lines  = 0;

  std::map<std::string, SourceStats> sources;
  std::string                        corpus_path;
};

} // namespace ragturn::retrieval
