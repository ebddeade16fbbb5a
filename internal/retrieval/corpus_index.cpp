#include "corpus_index.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <fstream>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/retrieval/text.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "ragturn/v1/corpus.pb.h"

namespace ragturn::retrieval {

namespace {

std::optional<Passage> ToPassage(const ragturn::v1::PassageRecord& record) {
  if (record.chunk_id().empty() || record.url().empty() || record.title().empty() || record.text().empty()) {
    return std::nullopt;
  }

  Passage p;
  p.chunk_id = record.chunk_id();
  p.doc_id   = record.doc_id();
  p.url      = record.url();
  p.title    = record.title();
  if (record.has_section() && !record.section().empty()) p.section = record.section();
  p.heading_path.assign(record.heading_path().begin(), record.heading_path().end());
  p.text   = record.text();
  p.source = ResolveSource(record.has_source() ? record.source() : std::string_view{}, record.url());

  const auto explicit_host = record.has_source_host() ? util::ToLowerAscii(util::Trim(record.source_host())) : std::string{};
  p.source_host            = explicit_host.empty() ? UrlHost(record.url()) : explicit_host;
  if (record.has_tokens_estimate()) p.tokens_estimate = record.tokens_estimate();
  return p;
}

} // namespace

LoadedCorpus LoadPassages(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::NotFound("corpus_not_found", "Unable to open corpus file: " + path);
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  LoadedCorpus corpus;
  std::string  line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (util::IsBlank(line)) continue;

    ragturn::v1::PassageRecord record;
    if (!google::protobuf::util::JsonStringToMessage(line, &record, options).ok()) {
      ++corpus.skipped_lines;
      continue;
    }

    auto passage = ToPassage(record);
    if (!passage) {
      ++corpus.skipped_lines;
      continue;
    }
    corpus.passages.push_back(std::move(*passage));
  }
  return corpus;
}

std::string UrlHost(std::string_view url) {
  const auto scheme = url.find("://");
  if (scheme == std::string_view::npos || scheme == 0) return "unknown";

  auto rest = url.substr(scheme + 3);
  rest      = rest.substr(0, rest.find_first_of("/?#"));
  if (const auto at = rest.rfind('@'); at != std::string_view::npos) rest = rest.substr(at + 1);
  if (const auto colon = rest.find(':'); colon != std::string_view::npos) rest = rest.substr(0, colon);

  auto host = util::ToLowerAscii(rest);
  return host.empty() ? "unknown" : host;
}

std::string ResolveSource(std::string_view explicit_source, std::string_view url) {
  auto normalized = util::ToLowerAscii(util::Trim(explicit_source));
  if (!normalized.empty()) return normalized;

  auto host = UrlHost(url);
  if (host == "unknown") return host;
  if (host.rfind("www.", 0) == 0) host = host.substr(4);
  auto label = host.substr(0, host.find('.'));
  return label.empty() ? "unknown" : label;
}

std::shared_ptr<const CorpusIndex> BuildCorpusIndex(LoadedCorpus corpus, std::string corpus_path) {
  auto index           = std::make_shared<CorpusIndex>();
  index->corpus_path   = std::move(corpus_path);
  index->skipped_lines = corpus.skipped_lines;
  index->passages.reserve(corpus.passages.size());

  std::unordered_set<std::string>                                  documents;
  std::unordered_map<std::string, std::unordered_set<std::string>> documents_by_source;
  std::size_t                                                      total_doc_length = 0;

  for (auto& passage : corpus.passages) {
    IndexedPassage entry;
    entry.cleaned_text     = CleanPassageText(passage.text);
    entry.searchable_title = LowerCase(passage.title);
    entry.searchable_text  = LowerCase(entry.cleaned_text);

    const auto terms = Tokenize(passage.title + "\n" + passage.section.value_or("") + "\n" + entry.cleaned_text);
    for (const auto& term : terms) ++entry.term_freq[term];
    for (const auto& [term, _] : entry.term_freq) ++index->doc_freq[term];

    entry.doc_length = std::max<int>(1, static_cast<int>(terms.size()));
    total_doc_length += static_cast<std::size_t>(entry.doc_length);

    for (auto& term : Tokenize(passage.title)) entry.title_terms.insert(std::move(term));

    documents.insert(passage.doc_id);
    auto& stats = index->sources[passage.source];
    ++stats.chunks;
    if (documents_by_source[passage.source].insert(passage.doc_id).second) ++stats.documents;

    entry.passage = std::move(passage);
    index->passages.push_back(std::move(entry));
  }

  index->passage_count  = index->passages.size();
  index->document_count = documents.size();
  index->avg_doc_length =
      std::max(1.0, static_cast<double>(total_doc_length) / static_cast<double>(std::max<std::size_t>(1, index->passage_count)));
  return index;
}

std::shared_ptr<const CorpusIndex> BuildCorpusIndex(const std::string& corpus_path) {
  auto corpus = LoadPassages(corpus_path);
  if (corpus.skipped_lines > 0) {
    RAGTURN_LOG_WARN("corpus lines skipped", {observability::StringField("path", corpus_path),
                                              observability::IntField("skipped", static_cast<std::int64_t>(corpus.skipped_lines))});
  }
  return BuildCorpusIndex(std::move(corpus), corpus_path);
}

} // namespace ragturn::retrieval
