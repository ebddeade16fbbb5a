#include <algorithm>
#include <chrono>
#include <cmath>

#include "internal/catalog/model_catalog.hpp"
#include "internal/credentials/credential_audit.hpp"
#include "internal/credentials/credential_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/provider/house_credentials.hpp"
#include "internal/turn/thread_access.hpp"
#include "internal/turn/turn_orchestrator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace ragturn::turn {

namespace {

double Clamp(const std::optional<double>& value, double min, double max, double fallback) {
  if (!value || !std::isfinite(*value)) return fallback;
  return std::max(min, std::min(max, *value));
}

std::string ReasonCode(const std::exception& error) {
  if (const auto* typed = dynamic_cast<const util::Error*>(&error)) {
    if (!typed->code().empty()) return typed->code();
  }
  return "unexpected_error";
}

} // namespace

PreparedTurn TurnOrchestrator::Prepare(const TurnRequest& request) {
  observability::SpanScope span("turn.prepare");
  const auto               started_at = std::chrono::steady_clock::now();

  PreparedTurn prepared;
  prepared.user_id = request.user_id;

  {
    auto tx     = deps_.repo->Begin();
    auto thread = deps_.repo->GetThread(*tx, request.thread_id);
    if (!thread) {
      throw util::NotFound("thread_not_found", "Thread not found");
    }
    CheckThreadAccess(*thread, request.user_id);

    auto content = util::Trim(request.content);
    if (content.empty()) {
      throw util::InvalidArgument("missing_content", "Message content is required.");
    }
    prepared.request_id = util::NewId();

    db::model::MessageRecord message;
    message.id            = util::NewId();
    message.thread_id     = thread->id;
    message.user_id       = request.user_id;
    message.role          = db::model::kRoleUser;
    message.content       = content;
    message.created_at_ms = static_cast<std::uint64_t>(util::NowMillis());
    db::ThrowIfDbError(deps_.repo->InsertMessage(*tx, message), "insert user message");
    tx->Commit();

    prepared.thread       = std::move(*thread);
    prepared.user_message = {message.id, message.content, message.created_at_ms};
  }
  span.SetAttribute("ragturn.request_id", prepared.request_id);
  span.SetAttribute("ragturn.visibility", prepared.thread.visibility);

  const auto models = deps_.catalog->Available();

  std::optional<std::string> requested;
  if (request.model_id) {
    auto trimmed = util::Trim(*request.model_id);
    if (!trimmed.empty()) requested = std::move(trimmed);
  }
  if (requested) {
    if (!catalog::ParseModelId(*requested)) {
      throw util::InvalidArgument("invalid_model_id", "Invalid model ID format.");
    }
    if (!catalog::FindModel(models, *requested)) {
      throw util::InvalidArgument("unsupported_model_id", "Unsupported model ID.");
    }
  }

  auto model_id = catalog::ResolveModelId(requested, models, deps_.settings.default_model_id);
  if (!model_id) {
    throw util::InvalidState("model_resolution_failed", "Unable to resolve an active model.");
  }
  const auto parsed = catalog::ParseModelId(*model_id);
  if (!parsed) {
    throw util::InvalidArgument("invalid_model_id", "Invalid model ID format.");
  }

  prepared.model_id = *model_id;
  if (const auto* spec = catalog::FindModel(models, *model_id)) {
    prepared.model = *spec;
  } else if (const auto* preset = catalog::FindPresetModel(*model_id)) {
    prepared.model = *preset;
  } else {
    prepared.model.id        = *model_id;
    prepared.model.provider  = parsed->provider;
    prepared.model.api_model = parsed->api_model;
    prepared.model.label     = *model_id;
    prepared.model.priced    = false;
  }
  span.SetAttribute("model_id", prepared.model_id);

  std::optional<std::string> credential_id;
  if (request.user_credential_id) {
    auto trimmed = util::Trim(*request.user_credential_id);
    if (!trimmed.empty()) credential_id = std::move(trimmed);
  }

  if (credential_id) {
    prepared.credential_id = credential_id;

    auto record = deps_.credential_store->Find(*credential_id, request.user_id);
    if (!record) {
      prepared.credential_provider = parsed->provider;
      AuditCredentialUse(prepared, false, std::string("invalid_user_api_key"));
      throw util::InvalidArgument("invalid_user_api_key", "Selected personal key was not found.");
    }
    prepared.credential_provider = record->provider;

    if (record->provider != parsed->provider) {
      AuditCredentialUse(prepared, false, std::string("user_api_key_provider_mismatch"));
      throw util::InvalidArgument("user_api_key_provider_mismatch", "Selected key is for " + record->provider + ", but model " + *model_id +
                                                                        " requires " + parsed->provider + ".");
    }

    credentials::DecryptedCredential decrypted;
    try {
      decrypted = deps_.credential_store->Decrypt(*record);
    } catch (const std::exception& e) {
      AuditCredentialUse(prepared, false, ReasonCode(e));
      throw;
    }

    prepared.personal_api_key   = std::move(decrypted.api_key);
    prepared.using_personal_key = true;

    if (decrypted.should_reencrypt) {
      deps_.credential_store->Reencrypt(*record, prepared.personal_api_key);
    }
  } else if (!deps_.house_credentials->Has(parsed->provider)) {
    throw util::InvalidArgument("missing_provider_key", "No server API key is configured for " + parsed->provider + ".");
  }

  prepared.top_k             = static_cast<std::size_t>(std::lround(Clamp(request.top_k, kMinTopK, kMaxTopK, kDefaultTopK)));
  prepared.temperature       = Clamp(request.temperature, kMinTemperature, kMaxTemperature, kDefaultTemperature);
  prepared.max_output_tokens = static_cast<int>(std::lround(Clamp(request.max_output_tokens, kMinOutputTokens, kMaxOutputTokens, kDefaultOutputTokens)));

  prepared.prepare_ms = util::MillisSince(started_at);
  return prepared;
}

void TurnOrchestrator::AuditCredentialUse(const PreparedTurn& prepared, bool success, const std::optional<std::string>& reason_code) {
  if (!prepared.credential_id) return;

  credentials::CredentialAuditEvent event;
  event.actor_user_id = prepared.user_id;
  event.action        = credentials::AuditAction::kUse;
  event.target_id     = *prepared.credential_id;
  event.provider      = prepared.credential_provider;
  event.success       = success;
  event.request_id    = prepared.request_id;
  event.reason_code   = reason_code;
  deps_.audit->Record(event);
}

} // namespace ragturn::turn
