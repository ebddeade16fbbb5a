#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "internal/retrieval/passage.hpp"

namespace ragturn::retrieval {

struct IndexDiagnostics {
  bool          built          = false;
  std::uint64_t build_count    = 0;
  double        last_build_ms  = 0.0;
  std::uint64_t built_at_ms    = 0;
  std::size_t   passage_count  = 0;
  std::size_t   document_count = 0;
  std::size_t   skipped_lines  = 0;
  std::string   corpus_path;
};

/*
  CorpusIndexCache

  Owns the process-wide corpus index.

  - Get() builds lazily on first use. Callers that arrive while a build is
    running wait on the same shared_future; the build runs once.
  - A failed build is rethrown to every waiter and forgotten, so the next
    Get() retries.
  - Rebuild() starts a fresh build (or joins one already running); readers
    keep the previous index until the new one is ready.
*/
class CorpusIndexCache {
 public:
  using Builder = std::function<std::shared_ptr<const CorpusIndex>(const std::string& path)>;

  explicit CorpusIndexCache(std::string corpus_path);
  CorpusIndexCache(std::string corpus_path, Builder builder);

  std::shared_ptr<const CorpusIndex> Get();
  std::shared_ptr<const CorpusIndex> Rebuild();

  IndexDiagnostics Diagnostics() const;

 private:
  using Future = std::shared_future<std::shared_ptr<const CorpusIndex>>;

  std::shared_ptr<const CorpusIndex> Obtain(bool force);
  void RunBuild(std::promise<std::shared_ptr<const CorpusIndex>>& promise);

  std::string corpus_path_;
  Builder     builder_;

  mutable std::mutex                 mutex_;
  std::shared_ptr<const CorpusIndex> current_;
  std::optional<Future>              in_flight_;
  std::uint64_t                      build_count_   = 0;
  double                             last_build_ms_ = 0.0;
  std::uint64_t                      built_at_ms_   = 0;
};

} // namespace ragturn::retrieval
