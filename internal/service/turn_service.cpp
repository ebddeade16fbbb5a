#include "turn_service.hpp"

#include "internal/turn/thread_access.hpp"
#include "internal/turn/turn_orchestrator.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::service {

using namespace ragturn::v1;

TurnService::TurnService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ragturn::turn::TurnRequest FromProto(const RunTurnRequest& req) {
  ragturn::turn::TurnRequest request;
  request.user_id   = req.user_id();
  request.thread_id = req.thread_id();
  request.content   = req.content();

  if (req.sources_size() > 0) {
    request.sources = std::vector<std::string>(req.sources().begin(), req.sources().end());
  }
  if (!req.model_id().empty()) request.model_id = req.model_id();
  if (req.has_top_k()) request.top_k = req.top_k();
  if (req.has_temperature()) request.temperature = req.temperature();
  if (req.has_max_output_tokens()) request.max_output_tokens = req.max_output_tokens();
  if (!req.user_credential_id().empty()) request.user_credential_id = req.user_credential_id();
  return request;
}

RunTurnResponse ToProto(const ragturn::turn::TurnResult& result) {
  RunTurnResponse resp;
  resp.set_thread_id(result.thread_id);
  resp.set_request_id(result.request_id);

  auto* user = resp.mutable_user_message();
  user->set_id(result.user_message.id);
  user->set_content(result.user_message.content);
  user->set_created_at_ms(static_cast<int64_t>(result.user_message.created_at_ms));

  const auto& assistant = result.assistant;
  auto*       out       = resp.mutable_assistant();
  out->set_id(assistant.id);
  out->set_content(assistant.content);
  out->set_created_at_ms(static_cast<int64_t>(assistant.created_at_ms));
  out->mutable_usage()->set_input_tokens(assistant.usage.input_tokens);
  out->mutable_usage()->set_output_tokens(assistant.usage.output_tokens);
  out->mutable_usage()->set_total_tokens(assistant.usage.total_tokens);

  auto* cost = out->mutable_cost();
  cost->set_input_cost_usd(assistant.cost.input_cost_usd);
  cost->set_output_cost_usd(assistant.cost.output_cost_usd);
  cost->set_total_cost_usd(assistant.cost.total_cost_usd);
  cost->set_has_pricing(assistant.cost.has_pricing);
  cost->set_pricing_tier(ragturn::catalog::ToString(assistant.cost.tier));

  out->set_cost_cents(assistant.cost_cents);
  out->set_model_id(assistant.model_id);
  out->set_provider(assistant.provider);
  out->set_billing_mode(assistant.billing_mode);

  for (const auto& citation : assistant.citations) {
    auto* c = out->add_citations();
    c->set_index(citation.index);
    c->set_chunk_id(citation.chunk_id);
    c->set_doc_id(citation.doc_id);
    c->set_title(citation.title);
    c->set_url(citation.url);
    if (citation.section) c->set_section(*citation.section);
    c->set_score(citation.score);
    c->set_snippet(citation.snippet);
    c->set_multiplier_applied(citation.multiplier_applied);
  }

  auto* budget = resp.mutable_budget();
  budget->set_reserved_cents(result.budget.reserved_cents);
  budget->set_charged_cents(result.budget.charged_cents);
  budget->set_released_cents(result.budget.released_cents);
  budget->set_remaining_balance_cents(result.budget.remaining_balance_cents);

  resp.mutable_retrieval()->set_count(result.retrieval_count);
  resp.mutable_retrieval()->set_top_k(result.top_k);
  return resp;
}

RunTurnResponse TurnService::RunTurn(const RunTurnRequest& req) {
  return ObserveRpc("TurnService.RunTurn", [&] {
    if (req.user_id().empty()) throw ragturn::util::InvalidArgument("missing_user_id", "user_id is required");
    if (req.thread_id().empty()) throw ragturn::util::InvalidArgument("missing_thread_id", "thread_id is required");
    return ToProto(ctx_.turns->Run(FromProto(req)));
  });
}

CreateThreadResponse TurnService::CreateThread(const CreateThreadRequest& req) {
  return ObserveRpc("TurnService.CreateThread", [&] {
    ragturn::turn::NewThread request;
    request.created_by_user_id = req.user_id();
    request.title              = req.title();
    request.visibility         = req.visibility();
    request.participant_ids.assign(req.participant_user_ids().begin(), req.participant_user_ids().end());

    CreateThreadResponse resp;
    resp.set_thread_id(ragturn::turn::CreateThread(*ctx_.repository, request).id);
    return resp;
  });
}

} // namespace ragturn::service
