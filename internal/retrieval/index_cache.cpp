#include "index_cache.hpp"

#include <chrono>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/retrieval/corpus_index.hpp"
#include "internal/util/time.hpp"

namespace ragturn::retrieval {

CorpusIndexCache::CorpusIndexCache(std::string corpus_path)
    : CorpusIndexCache(std::move(corpus_path), [](const std::string& path) { return BuildCorpusIndex(path); }) {
}

CorpusIndexCache::CorpusIndexCache(std::string corpus_path, Builder builder) : corpus_path_(std::move(corpus_path)), builder_(std::move(builder)) {
}

std::shared_ptr<const CorpusIndex> CorpusIndexCache::Get() {
  return Obtain(false);
}

std::shared_ptr<const CorpusIndex> CorpusIndexCache::Rebuild() {
  return Obtain(true);
}

std::shared_ptr<const CorpusIndex> CorpusIndexCache::Obtain(bool force) {
  std::promise<std::shared_ptr<const CorpusIndex>> promise;
  Future                                           future;
  bool                                             owner = false;
  {
    std::lock_guard lock(mutex_);
    if (current_ && !force) return current_;
    if (in_flight_) {
      future = *in_flight_;
    } else {
      future     = promise.get_future().share();
      in_flight_ = future;
      owner      = true;
    }
  }

  if (owner) RunBuild(promise);
  return future.get();
}

void CorpusIndexCache::RunBuild(std::promise<std::shared_ptr<const CorpusIndex>>& promise) {
  observability::SpanScope span("corpus.build_index");
  span.SetAttribute("corpus.path", corpus_path_);

  const auto start = std::chrono::steady_clock::now();
  try {
    auto       index   = builder_(corpus_path_);
    const auto elapsed = util::MillisSince(start);
    {
      std::lock_guard lock(mutex_);
      current_       = index;
      last_build_ms_ = elapsed;
      built_at_ms_   = util::NowMillis();
      ++build_count_;
      in_flight_.reset();
    }

    observability::Metrics::Instance().ObserveIndexBuildMs(elapsed);
    span.SetAttribute("corpus.passages", static_cast<std::int64_t>(index->passage_count));
    RAGTURN_LOG_INFO("corpus index built", {observability::StringField("path", corpus_path_),
                                            observability::IntField("passages", static_cast<std::int64_t>(index->passage_count)),
                                            observability::IntField("documents", static_cast<std::int64_t>(index->document_count)),
                                            observability::IntField("skipped_lines", static_cast<std::int64_t>(index->skipped_lines)),
                                            observability::DoubleField("elapsed_ms", elapsed)});
    promise.set_value(std::move(index));
  } catch (const std::exception& e) {
    {
      std::lock_guard lock(mutex_);
      in_flight_.reset();
    }
    span.RecordException(e);
    RAGTURN_LOG_ERROR("corpus index build failed", {observability::StringField("path", corpus_path_), observability::StringField("error", e.what())});
    promise.set_exception(std::current_exception());
  }
}

IndexDiagnostics CorpusIndexCache::Diagnostics() const {
  std::lock_guard  lock(mutex_);
  IndexDiagnostics diagnostics;
  diagnostics.built         = static_cast<bool>(current_);
  diagnostics.build_count   = build_count_;
  diagnostics.last_build_ms = last_build_ms_;
  diagnostics.built_at_ms   = built_at_ms_;
  diagnostics.corpus_path   = corpus_path_;
  if (current_) {
    diagnostics.passage_count  = current_->passage_count;
    diagnostics.document_count = current_->document_count;
    diagnostics.skipped_lines  = current_->skipped_lines;
  }
  return diagnostics;
}

} // namespace ragturn::retrieval
