#include "internal/retrieval/retrieval_engine.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/retrieval/corpus_index.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::retrieval;

Passage MakePassage(const std::string& chunk_id, const std::string& doc_id, const std::string& url, const std::string& title,
                    const std::string& text, const std::string& source = "support") {
  Passage p;
  p.chunk_id    = chunk_id;
  p.doc_id      = doc_id;
  p.url         = url;
  p.title       = title;
  p.text        = text;
  p.source      = source;
  p.source_host = UrlHost(url);
  return p;
}

std::shared_ptr<const CorpusIndex> MakeIndex() {
  LoadedCorpus corpus;
  corpus.passages.push_back(MakePassage("sso#0", "sso", "https://support.example.com/sso", "Configure single sign-on",
                                        "Single sign-on lets district staff log in once."));
  corpus.passages.push_back(MakePassage("sso#1", "sso", "https://support.example.com/sso", "Configure single sign-on",
                                        "Troubleshoot sign-on errors by checking the identity provider."));
  corpus.passages.push_back(MakePassage("rostering#0", "rostering", "https://support.example.com/rostering", "Rostering basics",
                                        "Rostering syncs sections nightly. Sign-on is separate."));
  corpus.passages.push_back(MakePassage("api#0", "api", "https://dev.example.com/api", "API authentication",
                                        "Use bearer tokens for API calls. Single sign-on is not required.", "dev"));
  corpus.passages.push_back(
      MakePassage("billing#0", "billing", "https://support.example.com/billing", "Billing", "Invoices are sent monthly."));
  return BuildCorpusIndex(std::move(corpus), "memory");
}

void TestEmptyAndStopwordQueriesReturnNothing() {
  RetrievalEngine engine(MakeIndex());
  assert(engine.Retrieve("   ", {}).empty());
  assert(engine.Retrieve("how is the", {}).empty());

  RetrievalOptions zero;
  zero.limit = 0;
  assert(engine.Retrieve("sign-on", zero).empty());
}

void TestTitleMatchesRankFirstAndUrlsAreDiverse() {
  RetrievalEngine engine(MakeIndex());
  RetrievalOptions options;
  options.limit = 3;

  const auto results = engine.Retrieve("single sign-on", options);
  assert(results.size() == 3);
  assert(results[0].passage->doc_id == "sso");
  // one passage per URL before backfilling
  assert(results[1].passage->url != results[0].passage->url);
  assert(results[2].passage->url != results[0].passage->url);
  assert(results[0].score >= results[1].score);
  assert(results[1].score >= results[2].score);
  assert(!results[0].snippet.empty());
  assert(!results[0].matched_terms.empty());
}

void TestBackfillsSameUrlWhenDiverseResultsRunOut() {
  RetrievalEngine  engine(MakeIndex());
  RetrievalOptions options;
  options.limit = 10;

  const auto results = engine.Retrieve("sign-on", options);
  // sso#0, sso#1, rostering#0, api#0 mention sign-on
  assert(results.size() == 4);
  assert(results.back().passage->url == "https://support.example.com/sso");
}

void TestSourceFilter() {
  RetrievalEngine  engine(MakeIndex());
  RetrievalOptions options;
  options.sources = std::vector<std::string>{" DEV "};

  const auto results = engine.Retrieve("single sign-on", options);
  assert(results.size() == 1);
  assert(results[0].passage->chunk_id == "api#0");

  options.sources = std::vector<std::string>{"marketing"};
  assert(engine.Retrieve("single sign-on", options).empty());

  assert((ResolveSourceFilter(*engine.index(), {"Support", "support", "nope"}) == std::vector<std::string>{"support"}));
}

void TestMultipliersReorderResults() {
  RetrievalEngine engine(MakeIndex());

  RetrievalOptions options;
  options.limit = 2;
  const auto baseline = engine.Retrieve("invoices rostering", options);
  assert(baseline.size() == 2);

  auto weights = std::make_shared<MultiplierMap>();
  (*weights)[baseline[0].passage->chunk_id] = 0.01;
  options.multipliers = weights;

  const auto reweighted = engine.Retrieve("invoices rostering", options);
  assert(reweighted.size() == 2);
  assert(reweighted[0].passage->chunk_id == baseline[1].passage->chunk_id);
  assert(std::fabs(reweighted[1].multiplier - 0.01) < 1e-12);
  assert(reweighted[0].multiplier == 1.0);
}

std::shared_ptr<const CorpusIndex> IndexOf(std::vector<Passage> passages) {
  LoadedCorpus corpus;
  corpus.passages = std::move(passages);
  return BuildCorpusIndex(std::move(corpus), "memory");
}

bool Near(double actual, double expected) {
  return std::fabs(actual - expected) < 1e-9;
}

void TestScoresMatchBm25ByHand() {
  // token counts 5, 6 and 4: avgdl 5, N 3, df(rostering) = df(setup) = 2
  RetrievalEngine engine(IndexOf({
      MakePassage("a#0", "a", "https://support.example.com/a", "Rostering setup", "Rostering syncs nightly."),
      MakePassage("b#0", "b", "https://support.example.com/b", "Nightly jobs", "The rostering setup runs nightly."),
      MakePassage("c#0", "c", "https://support.example.com/c", "Billing", "Invoices are sent monthly."),
  }));
  assert(Near(engine.index()->avg_doc_length, 5.0));

  const auto results = engine.Retrieve("Rostering setup", {});
  assert(results.size() == 2);

  const double idf = std::log(1.0 + (3.0 - 2.0 + 0.5) / (2.0 + 0.5));

  // a: docLen 5 so the length norm is 1; both terms are title terms; title phrase
  const double a_rostering = idf * (2.0 * 2.2) / (2.0 + 1.2 * 1.0);
  const double a_setup     = idf * (1.0 * 2.2) / (1.0 + 1.2 * 1.0);
  const double a_expected  = a_rostering + a_setup + 2 * idf * 0.8 + 2.5;

  // b: docLen 6, no title terms; body phrase
  const double b_norm     = 1.0 - 0.75 + 0.75 * (6.0 / 5.0);
  const double b_term     = idf * (1.0 * 2.2) / (1.0 + 1.2 * b_norm);
  const double b_expected = 2 * b_term + 1.2;

  assert(results[0].passage->chunk_id == "a#0");
  assert(Near(results[0].score, a_expected));
  assert(results[1].passage->chunk_id == "b#0");
  assert(Near(results[1].score, b_expected));
}

void TestPhraseBonusesFoldNonAsciiCase() {
  RetrievalEngine engine(IndexOf({
      MakePassage("ecole#0", "ecole", "https://support.example.com/ecole", "\xC3\x89COLE ROSTERING",
                  "\xC3\x89cole rostering overview."),
  }));

  const auto results = engine.Retrieve("\xC3\xA9cole rostering", {});
  assert(results.size() == 1);

  // N 1, df 1, docLen 5 == avgdl; each term has tf 2 and is a title term
  const double idf      = std::log(1.0 + 0.5 / 1.5);
  const double per_term = idf * (2.0 * 2.2) / (2.0 + 1.2) + idf * 0.8;
  assert(Near(results[0].score, 2 * per_term + 2.5 + 1.2));
}

void TestRepeatedQueriesAreIdentical() {
  RetrievalEngine engine(MakeIndex());

  RetrievalOptions options;
  options.limit       = 4;
  options.sources     = std::vector<std::string>{"support", "dev"};
  auto weights        = std::make_shared<MultiplierMap>();
  (*weights)["sso#1"] = 1.15;
  options.multipliers = weights;

  const auto first  = engine.Retrieve("single sign-on errors", options);
  const auto second = engine.Retrieve("single sign-on errors", options);
  assert(!first.empty());
  assert(first.size() == second.size());
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(first[i].passage == second[i].passage);
    assert(first[i].score == second[i].score);
    assert(first[i].snippet == second[i].snippet);
    assert(first[i].matched_terms == second[i].matched_terms);
  }
}

void TestSingleMatchingPassageSnippetCentresOnFirstHit() {
  const std::string lead_in =
      "District administrators manage several integrations each term, including gradebook exports, attendance feeds "
      "and parent messaging. ";
  RetrievalEngine engine(IndexOf({
      MakePassage("a#0", "a", "https://support.example.com/a", "Integrations overview", lead_in + "Rostering setup needs an SIS sync."),
      MakePassage("b#0", "b", "https://support.example.com/b", "Gradebook exports", "Grades export every Friday."),
      MakePassage("c#0", "c", "https://support.example.com/c", "Attendance feeds", "Attendance posts hourly."),
  }));

  RetrievalOptions options;
  options.limit      = 6;
  const auto results = engine.Retrieve("rostering setup", options);
  assert(results.size() == 1);
  assert(results[0].passage->chunk_id == "a#0");

  // the window opens 90 characters before "Rostering" and runs to the end of the text
  const auto& snippet = results[0].snippet;
  assert(snippet.rfind("...", 0) == 0);
  assert(snippet.find("Rostering") == 3 + 90);
  assert(snippet.size() >= 3 && snippet.substr(snippet.size() - 3) != "...");
}

void TestEngineRequiresIndex() {
  bool threw = false;
  try {
    RetrievalEngine engine(nullptr);
  } catch (const ragturn::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyAndStopwordQueriesReturnNothing();
  TestTitleMatchesRankFirstAndUrlsAreDiverse();
  TestBackfillsSameUrlWhenDiverseResultsRunOut();
  TestSourceFilter();
  TestMultipliersReorderResults();
  TestScoresMatchBm25ByHand();
  TestPhraseBonusesFoldNonAsciiCase();
  TestRepeatedQueriesAreIdentical();
  TestSingleMatchingPassageSnippetCentresOnFirstHit();
  TestEngineRequiresIndex();

  std::cout << "ragturn_unit_retrieval_engine: pass\n";
  return 0;
}
