#include "turn_orchestrator.hpp"

#include <chrono>
#include <utility>

#include "internal/credentials/credential_audit.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/retrieval/index_cache.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace ragturn::turn {

namespace {

std::string ErrorCodeOf(const std::exception& error, const char* fallback) {
  if (const auto* typed = dynamic_cast<const util::Error*>(&error)) {
    if (!typed->code().empty()) return typed->code();
  }
  return fallback;
}

const char* OutcomeOf(const std::exception& error) {
  if (dynamic_cast<const util::InsufficientBalance*>(&error)) return "insufficient_balance";
  if (dynamic_cast<const util::UpstreamFailure*>(&error)) return "upstream_failure";
  return "error";
}

} // namespace

TurnOrchestrator::TurnOrchestrator(TurnDependencies deps) : deps_(std::move(deps)) {
  if (!deps_.repo || !deps_.catalog || !deps_.house_credentials || !deps_.credential_store || !deps_.audit || !deps_.index_cache ||
      !deps_.weights || !deps_.ledger || !deps_.provider) {
    throw util::ConfigurationError("incomplete_dependencies", "turn orchestrator requires every dependency");
  }
}

TurnResult TurnOrchestrator::Run(const TurnRequest& request) {
  observability::ScopedLogContext thread_context({observability::StringField("thread_id", request.thread_id)});
  observability::SpanScope        span("turn.run");

  auto& metrics = observability::Metrics::Instance();

  PreparedTurn prepared;
  try {
    prepared = Prepare(request);
  } catch (const std::exception& e) {
    span.RecordException(e);
    metrics.RecordTurnOutcome("rejected");
    throw;
  }
  metrics.ObserveStageDurationMs("prepare", prepared.prepare_ms);
  span.SetAttribute("ragturn.request_id", prepared.request_id);
  observability::ScopedLogContext request_context({observability::StringField("request_id", prepared.request_id)});

  ReservationState reservation;
  TurnExecution    execution;
  try {
    execution = Execute(prepared, request.sources, reservation);
  } catch (const std::exception& e) {
    const auto code = ErrorCodeOf(e, "provider_request_failed");
    span.RecordException(e);
    RAGTURN_LOG_WARN("turn execution failed", {observability::StringField("code", code),
                                               observability::IntField("reserved_cents", reservation.reserved_cents)});

    Compensate(prepared, reservation, code);
    if (prepared.using_personal_key && !prepared.credential_use_audited) {
      AuditCredentialUse(prepared, false, ErrorCodeOf(e, "unexpected_error"));
    }
    metrics.RecordTurnOutcome(OutcomeOf(e));
    throw;
  }
  metrics.ObserveStageDurationMs("retrieval", execution.retrieval_ms);
  metrics.ObserveStageDurationMs("provider", execution.provider_ms);

  const auto finalize_started = std::chrono::steady_clock::now();
  TurnResult result;
  try {
    result = Finalize(prepared, execution);
  } catch (const std::exception& e) {
    // not compensated; an unsettled reservation stays on the ledger
    span.RecordException(e);
    RAGTURN_LOG_ERROR("turn finalize failed", {observability::IntField("reserved_cents", execution.reserved_cents),
                                               observability::StringField("error", e.what())});
    metrics.RecordTurnOutcome("finalize_failed");
    throw;
  }

  result.timings.prepare_ms   = prepared.prepare_ms;
  result.timings.retrieval_ms = execution.retrieval_ms;
  result.timings.provider_ms  = execution.provider_ms;
  result.timings.finalize_ms  = util::MillisSince(finalize_started);
  result.index                = deps_.index_cache->Diagnostics();

  metrics.ObserveStageDurationMs("finalize", result.timings.finalize_ms);
  metrics.RecordTurnOutcome("completed");

  RAGTURN_LOG_INFO("turn completed", {observability::StringField("model_id", result.assistant.model_id),
                                      observability::StringField("billing_mode", result.assistant.billing_mode),
                                      observability::IntField("citations", result.retrieval_count),
                                      observability::IntField("charged_cents", result.budget.charged_cents),
                                      observability::IntField("released_cents", result.budget.released_cents)});
  return result;
}

void TurnOrchestrator::Compensate(const PreparedTurn& prepared, const ReservationState& reservation, const std::string& error_code) {
  if (prepared.using_personal_key || reservation.reserved_cents <= 0) return;

  try {
    deps_.ledger->Release(reservation.owner_id, reservation.reserved_cents, reservation.correlation, "provider_error", error_code);
  } catch (const std::exception& e) {
    // logged only; the Execute error is what propagates
    RAGTURN_LOG_ERROR("reservation release failed", {observability::StringField("owner_id", reservation.owner_id),
                                                     observability::IntField("reserved_cents", reservation.reserved_cents),
                                                     observability::StringField("error", e.what())});
  }
}

} // namespace ragturn::turn
