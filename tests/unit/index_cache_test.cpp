#include "internal/retrieval/index_cache.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>
#include <vector>

namespace {

using ragturn::retrieval::CorpusIndex;
using ragturn::retrieval::CorpusIndexCache;

std::shared_ptr<const CorpusIndex> MakeIndex(std::size_t passages) {
  auto index            = std::make_shared<CorpusIndex>();
  index->passage_count  = passages;
  index->document_count = passages;
  return index;
}

void TestGetBuildsOnceAndCaches() {
  std::atomic<int> builds{0};
  CorpusIndexCache cache("/corpus/a.jsonl", [&](const std::string& path) {
    assert(path == "/corpus/a.jsonl");
    ++builds;
    return MakeIndex(3);
  });

  assert(!cache.Diagnostics().built);
  const auto first  = cache.Get();
  const auto second = cache.Get();
  assert(first == second);
  assert(builds.load() == 1);

  const auto diagnostics = cache.Diagnostics();
  assert(diagnostics.built);
  assert(diagnostics.build_count == 1);
  assert(diagnostics.passage_count == 3);
  assert(diagnostics.corpus_path == "/corpus/a.jsonl");
  assert(diagnostics.built_at_ms > 0);
}

void TestConcurrentCallersShareOneBuild() {
  std::atomic<int> builds{0};
  CorpusIndexCache cache("/corpus/b.jsonl", [&](const std::string&) {
    ++builds;
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    return MakeIndex(1);
  });

  std::vector<std::shared_ptr<const CorpusIndex>> results(8);
  std::vector<std::thread>                        threads;
  for (std::size_t i = 0; i < results.size(); ++i) {
    threads.emplace_back([&, i] { results[i] = cache.Get(); });
  }
  for (auto& t : threads) t.join();

  assert(builds.load() == 1);
  for (const auto& result : results) {
    assert(result == results.front());
  }
}

void TestFailedBuildIsRetried() {
  std::atomic<int> attempts{0};
  CorpusIndexCache cache("/corpus/c.jsonl", [&](const std::string&) -> std::shared_ptr<const CorpusIndex> {
    if (++attempts == 1) throw std::runtime_error("disk unavailable");
    return MakeIndex(2);
  });

  bool threw = false;
  try {
    (void)cache.Get();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
  assert(!cache.Diagnostics().built);

  const auto index = cache.Get();
  assert(index->passage_count == 2);
  assert(attempts.load() == 2);
}

void TestRebuildReplacesIndex() {
  std::atomic<int> builds{0};
  CorpusIndexCache cache("/corpus/d.jsonl", [&](const std::string&) { return MakeIndex(static_cast<std::size_t>(++builds)); });

  const auto first = cache.Get();
  assert(first->passage_count == 1);

  const auto rebuilt = cache.Rebuild();
  assert(rebuilt->passage_count == 2);
  assert(cache.Get() == rebuilt);
  assert(cache.Diagnostics().build_count == 2);
  // earlier holders keep their snapshot
  assert(first->passage_count == 1);
}

} // namespace

int main() {
  TestGetBuildsOnceAndCaches();
  TestConcurrentCallersShareOneBuild();
  TestFailedBuildIsRetried();
  TestRebuildReplacesIndex();

  std::cout << "ragturn_unit_index_cache: pass\n";
  return 0;
}
