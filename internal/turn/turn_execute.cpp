#include <chrono>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/retrieval/index_cache.hpp"
#include "internal/retrieval/weighting.hpp"
#include "internal/turn/grounding_prompt.hpp"
#include "internal/turn/turn_orchestrator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ragturn::turn {

namespace {

std::vector<provider::ChatMessage> LoadConversation(db::Repository& repo, const std::string& thread_id, std::size_t window) {
  auto tx      = repo.Begin();
  auto history = repo.ListRecentMessages(*tx, thread_id, window);
  tx->Commit();

  std::vector<provider::ChatMessage> conversation;
  conversation.reserve(history.size());
  for (auto& message : history) {
    if (message.role != db::model::kRoleUser && message.role != db::model::kRoleAssistant) continue;
    conversation.push_back({std::move(message.role), std::move(message.content)});
  }
  return conversation;
}

} // namespace

TurnExecution TurnOrchestrator::Execute(const PreparedTurn& prepared, const std::optional<std::vector<std::string>>& sources,
                                        ReservationState& reservation) {
  observability::SpanScope span("turn.execute");

  TurnExecution execution;

  // history includes the user message Prepare just stored
  auto conversation = LoadConversation(*deps_.repo, prepared.thread.id, deps_.settings.history_window);

  const auto retrieval_started = std::chrono::steady_clock::now();
  {
    retrieval::RetrievalOptions options;
    options.limit       = prepared.top_k;
    options.multipliers = deps_.weights->Multipliers();
    options.sources     = sources;

    execution.index = deps_.index_cache->Get();
    retrieval::RetrievalEngine engine(execution.index);
    execution.retrieval = engine.Retrieve(prepared.user_message.content, options);
  }
  execution.retrieval_ms = util::MillisSince(retrieval_started);
  span.SetAttribute("retrieval_count", static_cast<std::int64_t>(execution.retrieval.size()));

  execution.system_prompt    = BuildGroundingPrompt(execution.retrieval);
  execution.trimmed_messages = TrimConversation(std::move(conversation), deps_.settings.max_history_messages);

  std::vector<std::string> contents;
  contents.reserve(execution.trimmed_messages.size());
  for (const auto& message : execution.trimmed_messages) contents.push_back(message.content);

  const auto estimate = catalog::EstimateMaxTurnCostCents(&prepared.model, execution.system_prompt, contents, prepared.max_output_tokens,
                                                          deps_.settings.reservation_safety_multiplier);

  if (!prepared.using_personal_key) {
    ledger::Correlation correlation;
    correlation.request_id = prepared.request_id;
    correlation.thread_id  = prepared.thread.id;
    correlation.model_id   = prepared.model_id;
    correlation.provider   = prepared.model.provider;

    util::JsonObject metadata;
    util::SetInt(metadata, "inputTokensEstimate", estimate.input_tokens_estimate);
    util::SetInt(metadata, "outputTokensEstimate", estimate.output_tokens_estimate);
    util::SetString(metadata, "pricingTier", catalog::ToString(estimate.tier));

    deps_.ledger->Reserve(prepared.thread.created_by_user_id, estimate.estimated_cost_cents, correlation, metadata);

    reservation.owner_id       = prepared.thread.created_by_user_id;
    reservation.reserved_cents = estimate.estimated_cost_cents;
    reservation.correlation    = correlation;
    execution.reserved_cents   = estimate.estimated_cost_cents;
  }

  provider::ProviderRequest request;
  request.model_id          = prepared.model_id;
  request.provider          = prepared.model.provider;
  request.api_model         = prepared.model.api_model;
  request.messages          = execution.trimmed_messages;
  request.system_prompt     = execution.system_prompt;
  request.temperature       = prepared.temperature;
  request.max_output_tokens = prepared.max_output_tokens;
  if (prepared.using_personal_key) request.api_key = prepared.personal_api_key;

  const auto provider_started = std::chrono::steady_clock::now();
  try {
    execution.response = deps_.provider->Complete(request);
  } catch (const std::exception& e) {
    span.RecordException(e);
    RAGTURN_LOG_ERROR("provider request failed", {observability::StringField("request_id", prepared.request_id),
                                                  observability::StringField("model_id", prepared.model_id),
                                                  observability::StringField("error", e.what())});
    throw util::UpstreamFailure("provider_request_failed", "Model provider request failed.");
  }
  execution.provider_ms = util::MillisSince(provider_started);

  execution.measured_cost     = catalog::CalculateCost(execution.response.usage, &prepared.model);
  execution.actual_cost_cents = prepared.using_personal_key ? 0 : catalog::UsdToCentsCeil(execution.measured_cost.total_cost_usd);
  return execution;
}

} // namespace ragturn::turn
