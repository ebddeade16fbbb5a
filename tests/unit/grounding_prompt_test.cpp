#include "internal/turn/grounding_prompt.hpp"

#include <cassert>
#include <iostream>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/turn/thread_access.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace ragturn::turn;
using ragturn::provider::ChatMessage;
using ragturn::retrieval::Passage;
using ragturn::retrieval::RetrievalResult;

void TestPromptWithoutContext() {
  const auto prompt = BuildGroundingPrompt({});
  assert(prompt.find("Answer only using the supplied context excerpts.") != std::string::npos);
  assert(prompt.find("Support article context:\nNo context found.") != std::string::npos);
}

void TestPromptNumbersExcerpts() {
  Passage first;
  first.title        = "Reset your password";
  first.url          = "https://support.example.com/reset";
  first.section      = "Steps";
  first.heading_path = {"Account", "Reset"};
  first.text         = "Open settings.";

  Passage second;
  second.title = "Billing";
  second.url   = "https://support.example.com/billing";
  second.text  = "Invoices are monthly.";

  std::vector<RetrievalResult> results(2);
  results[0].passage = &first;
  results[1].passage = &second;

  const auto prompt = BuildGroundingPrompt(results);
  assert(prompt.find("[1]\nTitle: Reset your password\nURL: https://support.example.com/reset\nSection: Steps\n"
                     "Heading path: Account > Reset\nExcerpt:\nOpen settings.") != std::string::npos);
  assert(prompt.find("[2]\nTitle: Billing") != std::string::npos);
  assert(prompt.find("Section: (not provided)\nHeading path: Billing\n") != std::string::npos);
  assert(prompt.find("No context found.") == std::string::npos);
  assert(prompt.find("[1]") < prompt.find("[2]\n"));
}

void TestTrimConversationKeepsNewest() {
  std::vector<ChatMessage> messages;
  for (int i = 0; i < 5; ++i) messages.push_back({i % 2 == 0 ? "user" : "assistant", std::to_string(i)});

  const auto trimmed = TrimConversation(messages, 3);
  assert(trimmed.size() == 3);
  assert(trimmed.front().content == "2");
  assert(trimmed.back().content == "4");
  assert(TrimConversation(messages, 12).size() == 5);
}

void TestDeriveThreadTitle() {
  assert(DeriveThreadTitle("  \n\t ") == "New thread");
  assert(DeriveThreadTitle("How do I\n  reset   SSO?") == "How do I reset SSO?");

  const std::string exact(72, 'a');
  assert(DeriveThreadTitle(exact) == exact);

  // the cut lands after a space, which is dropped
  const auto long_title = DeriveThreadTitle(std::string(68, 'b') + "  tail of a much longer question");
  assert(long_title == std::string(68, 'b') + "...");

  // lengths count characters, not UTF-8 bytes
  std::string accented;
  for (int i = 0; i < 40; ++i) accented += "\xC3\xA9";
  assert(DeriveThreadTitle(accented) == accented);

  std::string long_accented = "a";
  for (int i = 0; i < 80; ++i) long_accented += "\xC3\xA9";
  std::string expected = "a";
  for (int i = 0; i < 68; ++i) expected += "\xC3\xA9";
  assert(DeriveThreadTitle(long_accented) == expected + "...");
}

void TestThreadAccess() {
  ragturn::db::model::ThreadRecord thread;
  thread.created_by_user_id = "owner";
  thread.visibility         = "org";
  CheckThreadAccess(thread, "anyone");

  thread.visibility      = "private";
  thread.participant_ids = {"guest"};
  CheckThreadAccess(thread, "owner");
  CheckThreadAccess(thread, "guest");

  bool threw = false;
  try {
    CheckThreadAccess(thread, "stranger");
  } catch (const ragturn::util::PermissionDenied& e) {
    threw = e.code() == "forbidden";
  }
  assert(threw);
}

void TestCreateThread() {
  ragturn::db::memory::MemoryRepository repo;

  NewThread request;
  request.created_by_user_id = "owner";
  request.visibility         = " Private ";
  request.participant_ids    = {"guest"};
  const auto created         = CreateThread(repo, request);
  assert(created.title == "New thread");
  assert(created.visibility == "private");

  auto tx     = repo.Begin();
  auto stored = repo.GetThread(*tx, created.id);
  tx->Commit();
  assert(stored.has_value());
  assert(stored->created_by_user_id == "owner");
  assert(stored->participant_ids.size() == 1);

  request.visibility = "public";
  bool threw         = false;
  try {
    (void)CreateThread(repo, request);
  } catch (const ragturn::util::InvalidArgument& e) {
    threw = e.code() == "invalid_visibility";
  }
  assert(threw);

  NewThread anonymous;
  threw = false;
  try {
    (void)CreateThread(repo, anonymous);
  } catch (const ragturn::util::InvalidArgument& e) {
    threw = e.code() == "missing_user_id";
  }
  assert(threw);
}

} // namespace

int main() {
  TestPromptWithoutContext();
  TestPromptNumbersExcerpts();
  TestTrimConversationKeepsNewest();
  TestDeriveThreadTitle();
  TestThreadAccess();
  TestCreateThread();

  std::cout << "ragturn_unit_grounding_prompt: pass\n";
  return 0;
}
