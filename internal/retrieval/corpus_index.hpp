#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/retrieval/passage.hpp"

namespace ragturn::retrieval {

struct LoadedCorpus {
  std::vector<Passage> passages;
  std::size_t          skipped_lines = 0;
};

/*
  Reads a JSONL corpus. Blank lines are ignored; lines that fail to parse
  or lack chunk_id, url, title or text are skipped and counted.
  Throws util::NotFound when the file cannot be opened.
*/
LoadedCorpus LoadPassages(const std::string& path);

// Lowercased hostname of an http(s) URL, or "unknown".
std::string UrlHost(std::string_view url);

// Explicit source tag when present, else the first hostname label without "www.".
std::string ResolveSource(std::string_view explicit_source, std::string_view url);

std::shared_ptr<const CorpusIndex> BuildCorpusIndex(LoadedCorpus corpus, std::string corpus_path);
std::shared_ptr<const CorpusIndex> BuildCorpusIndex(const std::string& corpus_path);

} // namespace ragturn::retrieval
