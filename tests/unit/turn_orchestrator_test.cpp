#include "internal/turn/turn_orchestrator.hpp"

#include <cassert>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "tests/support/turn_fixture.hpp"

namespace {

using ragturn::db::model::LedgerEntryType;
using ragturn::testing::TurnFixture;

template <typename Error, typename Fn>
std::string CodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.code();
  }
  return "no error";
}

void TestHouseKeyTurnSettlesReservation() {
  TurnFixture f;
  const auto  thread_id = f.NewThread("owner");
  (void)f.ledger->Grant("owner", 1000, "admin", std::nullopt);

  const auto result = f.orchestrator->Run(f.Ask("member", thread_id, "  How do I reset my password?  "));

  assert(result.thread_id == thread_id);
  assert(!result.request_id.empty());
  assert(result.user_message.content == "How do I reset my password?");
  assert(result.assistant.billing_mode == "house_key");
  assert(result.assistant.model_id == "openai:gpt-5-mini");
  assert(result.assistant.provider == "openai");
  assert(result.assistant.content == f.provider->answer);
  assert(result.assistant.usage.total_tokens == 1200);
  assert(result.assistant.cost.has_pricing);
  assert(result.top_k == 6);

  // 1000 in at $0.25/M plus 200 out at $2/M rounds up to one cent
  assert(result.assistant.cost_cents == 1);
  assert(result.budget.reserved_cents >= 1);
  assert(result.budget.charged_cents == 1);
  assert(result.budget.charged_cents + result.budget.released_cents == result.budget.reserved_cents);
  assert(result.budget.remaining_balance_cents == 999);
  assert(f.ledger->Balance("owner").lifetime_spent_cents == 1);

  assert(result.retrieval_count > 0);
  assert(result.assistant.citations.front().index == 1);
  assert(result.assistant.citations.front().doc_id == "reset");
  assert(result.index.built);
  assert(result.index.passage_count == 4);

  const auto& request = *f.provider->last_request;
  assert(request.api_key.empty());
  assert(request.provider == "openai");
  assert(request.api_model == "gpt-5-mini");
  assert(request.system_prompt.find("[1]\nTitle: Reset your password") != std::string::npos);
  assert(request.messages.size() == 1);
  assert(request.messages.back().role == "user");

  const auto messages = f.Messages(thread_id);
  assert(messages.size() == 2);
  assert(messages[0].role == "user");
  assert(messages[0].user_id == "member");
  assert(messages[1].role == "assistant");
  assert(messages[1].cost_cents == 1);
  assert(ragturn::util::ParseJsonObject(messages[1].usage_json).fields().at("billingMode").string_value() == "house_key");

  auto tx        = f.repo->Begin();
  auto citations = f.repo->ListCitations(*tx, result.assistant.id);
  auto thread    = f.repo->GetThread(*tx, thread_id);
  tx->Commit();
  assert(citations.size() == result.retrieval_count);
  assert(citations.front().rank == 1);
  assert(thread->title == "How do I reset my password?");

  const auto history = f.ledger->History("owner");
  assert(history.size() >= 3);
  assert(history[1].type == LedgerEntryType::kReserve);
  assert(history[1].request_id == result.request_id);
  assert(history[2].type == LedgerEntryType::kDebit);
  assert(history[2].message_id == result.assistant.id);
}

void TestCreatorIsChargedNotCaller() {
  TurnFixture f;
  const auto  thread_id = f.NewThread("owner");
  (void)f.ledger->Grant("owner", 100, "admin", std::nullopt);
  (void)f.ledger->Grant("member", 100, "admin", std::nullopt);

  (void)f.orchestrator->Run(f.Ask("member", thread_id, "reset password"));
  assert(f.ledger->Balance("owner").balance_cents == 99);
  assert(f.ledger->Balance("member").balance_cents == 100);
}

void TestInsufficientBalanceSkipsProvider() {
  TurnFixture f;
  const auto  thread_id = f.NewThread("owner");

  bool threw = false;
  try {
    (void)f.orchestrator->Run(f.Ask("owner", thread_id, "reset password"));
  } catch (const ragturn::util::InsufficientBalance& e) {
    threw = e.remaining_cents() == 0;
  }
  assert(threw);
  assert(f.provider->calls == 0);
  assert(f.ledger->History("owner").empty());

  // the user message was already stored by the prepare stage
  const auto messages = f.Messages(thread_id);
  assert(messages.size() == 1);
  assert(messages[0].role == "user");
}

void TestProviderFailureReleasesReservation() {
  TurnFixture f;
  const auto  thread_id = f.NewThread("owner");
  (void)f.ledger->Grant("owner", 500, "admin", std::nullopt);
  f.provider->fail = true;

  const auto code = CodeOf<ragturn::util::UpstreamFailure>([&] { (void)f.orchestrator->Run(f.Ask("owner", thread_id, "reset password")); });
  assert(code == "provider_request_failed");

  const auto balance = f.ledger->Balance("owner");
  assert(balance.balance_cents == 500);
  assert(balance.lifetime_spent_cents == 0);

  const auto history = f.ledger->History("owner");
  assert(history.size() == 3);
  assert(history[1].type == LedgerEntryType::kReserve);
  assert(history[2].type == LedgerEntryType::kRelease);
  assert(history[2].amount_cents == history[1].amount_cents);
  assert(history[2].request_id == history[1].request_id);

  const auto metadata = ragturn::util::ParseJsonObject(history[2].metadata_json);
  assert(metadata.fields().at("reason").string_value() == "provider_error");
  assert(metadata.fields().at("code").string_value() == "provider_request_failed");

  // no assistant message
  assert(f.Messages(thread_id).size() == 1);
}

void TestPersonalKeyBypassesLedger() {
  TurnFixture f;
  const auto  thread_id  = f.NewThread("owner");
  const auto  credential = f.store->Register("member", "anthropic", "mine", "sk-ant-personal-0001");

  auto request               = f.Ask("member", thread_id, "reset password");
  request.model_id           = "anthropic:claude-haiku-4-5";
  request.user_credential_id = credential.id;
  const auto result          = f.orchestrator->Run(request);

  assert(result.assistant.billing_mode == "personal_key");
  assert(result.assistant.cost_cents == 0);
  assert(result.assistant.cost.has_pricing);
  assert(result.budget.reserved_cents == 0);
  assert(result.budget.charged_cents == 0);
  assert(result.budget.remaining_balance_cents == 0);
  assert(f.provider->last_request->api_key == "sk-ant-personal-0001");
  assert(f.ledger->History("owner").empty());

  const auto uses = f.AuditEvents("user_api_key.use");
  assert(uses.size() == 1);
  assert(uses[0].actor_user_id == "member");
  assert(uses[0].target_id == credential.id);
  assert(ragturn::util::ParseJsonObject(uses[0].metadata_json).fields().at("result").string_value() == "success");
}

void TestPersonalKeyProviderFailureIsAudited() {
  TurnFixture f;
  const auto  thread_id  = f.NewThread("owner");
  const auto  credential = f.store->Register("member", "openai", "", "sk-personal-0002");
  f.provider->fail       = true;

  auto request               = f.Ask("member", thread_id, "reset password");
  request.user_credential_id = credential.id;
  const auto code = CodeOf<ragturn::util::UpstreamFailure>([&] { (void)f.orchestrator->Run(request); });
  assert(code == "provider_request_failed");

  const auto uses = f.AuditEvents("user_api_key.use");
  assert(uses.size() == 1);
  const auto metadata = ragturn::util::ParseJsonObject(uses[0].metadata_json);
  assert(metadata.fields().at("result").string_value() == "failure");
  assert(metadata.fields().at("reasonCode").string_value() == "provider_request_failed");
  assert(f.ledger->History("owner").empty());
}

void TestPersonalKeyProviderMismatch() {
  TurnFixture f;
  const auto  thread_id  = f.NewThread("owner");
  const auto  credential = f.store->Register("member", "anthropic", "", "sk-ant-personal-0003");

  auto request               = f.Ask("member", thread_id, "reset password");
  request.model_id           = "openai:gpt-5";
  request.user_credential_id = credential.id;

  std::string message;
  try {
    (void)f.orchestrator->Run(request);
  } catch (const ragturn::util::InvalidArgument& e) {
    assert(e.code() == "user_api_key_provider_mismatch");
    message = e.what();
  }
  assert(message == "Selected key is for anthropic, but model openai:gpt-5 requires openai.");
  assert(f.provider->calls == 0);

  const auto uses = f.AuditEvents("user_api_key.use");
  assert(uses.size() == 1);
  assert(ragturn::util::ParseJsonObject(uses[0].metadata_json).fields().at("reasonCode").string_value() ==
         "user_api_key_provider_mismatch");
}

void TestUnknownPersonalKeyIsRejected() {
  TurnFixture f;
  const auto  thread_id  = f.NewThread("owner");
  const auto  credential = f.store->Register("owner", "openai", "", "sk-owner-0004");

  // another user's key reads as missing
  auto request               = f.Ask("member", thread_id, "reset password");
  request.user_credential_id = credential.id;
  assert(CodeOf<ragturn::util::InvalidArgument>([&] { (void)f.orchestrator->Run(request); }) == "invalid_user_api_key");
  assert(f.AuditEvents("user_api_key.use").size() == 1);
}

void TestRequestValidation() {
  TurnFixture f;
  const auto  org_thread     = f.NewThread("owner");
  const auto  private_thread = f.NewThread("owner", "private", {"guest"});
  (void)f.ledger->Grant("owner", 1000, "admin", std::nullopt);

  assert(CodeOf<ragturn::util::NotFound>([&] { (void)f.orchestrator->Run(f.Ask("owner", "missing", "hi there")); }) == "thread_not_found");
  assert(CodeOf<ragturn::util::PermissionDenied>([&] { (void)f.orchestrator->Run(f.Ask("stranger", private_thread, "hi there")); }) ==
         "forbidden");
  assert(CodeOf<ragturn::util::InvalidArgument>([&] { (void)f.orchestrator->Run(f.Ask("owner", org_thread, "   ")); }) ==
         "missing_content");

  auto bad_format     = f.Ask("owner", org_thread, "reset password");
  bad_format.model_id = "gpt-5";
  assert(CodeOf<ragturn::util::InvalidArgument>([&] { (void)f.orchestrator->Run(bad_format); }) == "invalid_model_id");

  auto unsupported     = f.Ask("owner", org_thread, "reset password");
  unsupported.model_id = "openai:gpt-9";
  assert(CodeOf<ragturn::util::InvalidArgument>([&] { (void)f.orchestrator->Run(unsupported); }) == "unsupported_model_id");

  // listed because personal keys may override, but the house has no gemini key
  auto no_house_key     = f.Ask("owner", org_thread, "reset password");
  no_house_key.model_id = "gemini:gemini-2.5-flash";
  assert(CodeOf<ragturn::util::InvalidArgument>([&] { (void)f.orchestrator->Run(no_house_key); }) == "missing_provider_key");

  assert(f.provider->calls == 0);

  // the guest may post in the private thread
  (void)f.orchestrator->Run(f.Ask("guest", private_thread, "reset password"));
  assert(f.provider->calls == 1);
}

void TestParametersAreClamped() {
  TurnFixture f;
  const auto  thread_id = f.NewThread("owner");
  (void)f.ledger->Grant("owner", 1000, "admin", std::nullopt);

  auto request              = f.Ask("owner", thread_id, "reset password");
  request.top_k             = 2.5;
  request.temperature       = 5.0;
  request.max_output_tokens = 10;
  const auto result         = f.orchestrator->Run(request);
  assert(result.top_k == 3);
  assert(f.provider->last_request->temperature == 1.2);
  assert(f.provider->last_request->max_output_tokens == 128);

  request.top_k             = 100;
  request.temperature       = -1;
  request.max_output_tokens = 1e9;
  const auto clamped_high   = f.orchestrator->Run(request);
  assert(clamped_high.top_k == 10);
  assert(f.provider->last_request->temperature == 0.0);
  assert(f.provider->last_request->max_output_tokens == 4096);
}

void TestHistoryIsTrimmed() {
  TurnFixture f;
  const auto  thread_id = f.NewThread("owner");
  (void)f.ledger->Grant("owner", 1000, "admin", std::nullopt);

  {
    auto tx = f.repo->Begin();
    for (int i = 0; i < 20; ++i) {
      ragturn::db::model::MessageRecord message;
      message.id        = "seed-" + std::to_string(i);
      message.thread_id = thread_id;
      message.role      = i % 2 == 0 ? "user" : "assistant";
      message.content   = "earlier " + std::to_string(i);
      message.created_at_ms = 1000 + static_cast<std::uint64_t>(i);
      ragturn::db::ThrowIfDbError(f.repo->InsertMessage(*tx, message), "seed message");
    }
    tx->Commit();
  }

  (void)f.orchestrator->Run(f.Ask("owner", thread_id, "reset password"));
  const auto& messages = f.provider->last_request->messages;
  assert(messages.size() == 12);
  assert(messages.front().content == "earlier 9");
  assert(messages.back().content == "reset password");
}

void TestExistingTitleIsKept() {
  TurnFixture f;
  ragturn::turn::NewThread request;
  request.created_by_user_id = "owner";
  request.title              = "Password questions";
  const auto thread_id       = ragturn::turn::CreateThread(*f.repo, request).id;
  (void)f.ledger->Grant("owner", 1000, "admin", std::nullopt);

  (void)f.orchestrator->Run(f.Ask("owner", thread_id, "reset password"));
  auto tx     = f.repo->Begin();
  auto thread = f.repo->GetThread(*tx, thread_id);
  tx->Commit();
  assert(thread->title == "Password questions");
}

void TestSourceFilterLimitsCitations() {
  TurnFixture f;
  const auto  thread_id = f.NewThread("owner");
  (void)f.ledger->Grant("owner", 1000, "admin", std::nullopt);

  auto request    = f.Ask("owner", thread_id, "password");
  request.sources = std::vector<std::string>{"dev"};
  const auto result = f.orchestrator->Run(request);
  assert(result.retrieval_count == 1);
  assert(result.assistant.citations[0].chunk_id == "api#0");

  request.sources        = std::vector<std::string>{"unknown-source"};
  const auto no_context  = f.orchestrator->Run(request);
  assert(no_context.retrieval_count == 0);
  assert(f.provider->last_request->system_prompt.find("No context found.") != std::string::npos);
}

void TestIncompleteDependenciesAreRejected() {
  bool threw = false;
  try {
    ragturn::turn::TurnOrchestrator orchestrator(ragturn::turn::TurnDependencies{});
  } catch (const ragturn::util::ConfigurationError& e) {
    threw = e.code() == "incomplete_dependencies";
  }
  assert(threw);
}

} // namespace

int main() {
  TestHouseKeyTurnSettlesReservation();
  TestCreatorIsChargedNotCaller();
  TestInsufficientBalanceSkipsProvider();
  TestProviderFailureReleasesReservation();
  TestPersonalKeyBypassesLedger();
  TestPersonalKeyProviderFailureIsAudited();
  TestPersonalKeyProviderMismatch();
  TestUnknownPersonalKeyIsRejected();
  TestRequestValidation();
  TestParametersAreClamped();
  TestHistoryIsTrimmed();
  TestExistingTitleIsKept();
  TestSourceFilterLimitsCitations();
  TestIncompleteDependenciesAreRejected();

  std::cout << "ragturn_unit_turn_orchestrator: pass\n";
  return 0;
}
