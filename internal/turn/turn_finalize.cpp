#include <chrono>
#include <cmath>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/turn/thread_access.hpp"
#include "internal/turn/turn_orchestrator.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ragturn::turn {

namespace {

double RoundScore(double score) {
  return std::round(score * 10000.0) / 10000.0;
}

std::string UsageJson(const PreparedTurn& prepared, const TurnExecution& execution) {
  const auto& usage = execution.response.usage;
  const auto& cost  = execution.measured_cost;

  util::JsonObject object;
  util::SetInt(object, "inputTokens", usage.input_tokens);
  util::SetInt(object, "outputTokens", usage.output_tokens);
  util::SetInt(object, "totalTokens", usage.total_tokens);
  util::SetString(object, "billingMode", prepared.using_personal_key ? db::model::kBillingPersonalKey : db::model::kBillingHouseKey);
  util::SetInt(object, "estimatedReservationCents", execution.reserved_cents);
  util::SetNumber(object, "measuredCostUsd", cost.total_cost_usd);
  util::SetNumber(object, "measuredInputCostUsd", cost.input_cost_usd);
  util::SetNumber(object, "measuredOutputCostUsd", cost.output_cost_usd);
  util::SetBool(object, "measuredHasPricing", cost.has_pricing);
  return util::ToJson(object);
}

} // namespace

TurnResult TurnOrchestrator::Finalize(const PreparedTurn& prepared, const TurnExecution& execution) {
  observability::SpanScope span("turn.finalize");

  if (prepared.using_personal_key && !prepared.credential_use_audited) {
    AuditCredentialUse(prepared, true, std::nullopt);
  }

  const auto provider_name = execution.response.provider.empty() ? prepared.model.provider : execution.response.provider;
  const auto billing_mode  = prepared.using_personal_key ? db::model::kBillingPersonalKey : db::model::kBillingHouseKey;
  const auto now_ms        = static_cast<std::uint64_t>(util::NowMillis());

  const auto title =
      prepared.thread.title == db::model::kDefaultThreadTitle ? DeriveThreadTitle(prepared.user_message.content) : prepared.thread.title;

  db::model::MessageRecord assistant;
  assistant.id            = util::NewId();
  assistant.thread_id     = prepared.thread.id;
  assistant.role          = db::model::kRoleAssistant;
  assistant.content       = execution.response.text;
  assistant.model_id      = prepared.model_id;
  assistant.provider      = provider_name;
  assistant.input_tokens  = execution.response.usage.input_tokens;
  assistant.output_tokens = execution.response.usage.output_tokens;
  assistant.total_tokens  = execution.response.usage.total_tokens;
  assistant.cost_cents    = execution.actual_cost_cents;
  assistant.billing_mode  = billing_mode;
  assistant.usage_json    = UsageJson(prepared, execution);
  assistant.created_at_ms = now_ms;

  std::vector<db::model::CitationRecord> citation_rows;
  citation_rows.reserve(execution.retrieval.size());
  for (std::size_t i = 0; i < execution.retrieval.size(); ++i) {
    const auto& item = execution.retrieval[i];

    db::model::CitationRecord row;
    row.message_id = assistant.id;
    row.rank       = static_cast<int>(i + 1);
    row.chunk_id   = item.passage->chunk_id;
    row.doc_id     = item.passage->doc_id;
    row.url        = item.passage->url;
    row.title      = item.passage->title;
    row.section    = item.passage->section.value_or("");
    row.score      = item.score;
    row.snippet    = item.snippet;
    row.multiplier = item.multiplier;
    citation_rows.push_back(std::move(row));
  }

  {
    auto tx = deps_.repo->Begin();
    db::ThrowIfDbError(deps_.repo->InsertMessage(*tx, assistant), "insert assistant message");
    if (!citation_rows.empty()) {
      db::ThrowIfDbError(deps_.repo->InsertCitations(*tx, citation_rows), "insert citations");
    }
    db::ThrowIfDbError(deps_.repo->UpdateThreadTitle(*tx, prepared.thread.id, title, now_ms), "update thread");
    tx->Commit();
  }

  BudgetSummary budget;
  budget.reserved_cents = execution.reserved_cents;

  if (prepared.using_personal_key) {
    budget.remaining_balance_cents = deps_.ledger->Balance(prepared.thread.created_by_user_id).balance_cents;
  } else {
    ledger::Correlation correlation;
    correlation.request_id = prepared.request_id;
    correlation.thread_id  = prepared.thread.id;
    correlation.message_id = assistant.id;
    correlation.model_id   = prepared.model_id;
    correlation.provider   = provider_name;

    util::JsonObject metadata;
    util::SetString(metadata, "pricingTier", catalog::ToString(execution.measured_cost.tier));
    util::SetBool(metadata, "hasPricing", execution.measured_cost.has_pricing);

    const auto settled = deps_.ledger->Finalize(prepared.thread.created_by_user_id, execution.reserved_cents, execution.actual_cost_cents,
                                                correlation, metadata);
    budget.charged_cents           = settled.debited_cents;
    budget.released_cents          = settled.released_cents;
    budget.remaining_balance_cents = settled.remaining_balance_cents;
  }

  TurnResult result;
  result.thread_id    = prepared.thread.id;
  result.request_id   = prepared.request_id;
  result.user_message = prepared.user_message;

  auto& out         = result.assistant;
  out.id            = assistant.id;
  out.content       = assistant.content;
  out.created_at_ms = assistant.created_at_ms;
  out.usage         = execution.response.usage;
  out.cost          = execution.measured_cost;
  out.cost_cents    = execution.actual_cost_cents;
  out.model_id      = prepared.model_id;
  out.provider      = provider_name;
  out.billing_mode  = billing_mode;

  out.citations.reserve(execution.retrieval.size());
  for (std::size_t i = 0; i < execution.retrieval.size(); ++i) {
    const auto& item = execution.retrieval[i];

    TurnCitation citation;
    citation.index              = static_cast<std::uint32_t>(i + 1);
    citation.chunk_id           = item.passage->chunk_id;
    citation.doc_id             = item.passage->doc_id;
    citation.title              = item.passage->title;
    citation.url                = item.passage->url;
    citation.section            = item.passage->section;
    citation.score              = RoundScore(item.score);
    citation.snippet            = item.snippet;
    citation.multiplier_applied = item.multiplier;
    out.citations.push_back(std::move(citation));
  }

  result.budget          = budget;
  result.retrieval_count = static_cast<std::uint32_t>(out.citations.size());
  result.top_k           = static_cast<std::uint32_t>(prepared.top_k);
  return result;
}

} // namespace ragturn::turn
