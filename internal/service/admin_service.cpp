#include "admin_service.hpp"

#include <optional>

#include "internal/credentials/credential_store.hpp"
#include "internal/ledger/balance_ledger.hpp"
#include "internal/retrieval/index_cache.hpp"
#include "internal/retrieval/weighting.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::service {

using namespace ragturn::v1;

namespace {

void RequireUser(const std::string& user_id) {
  if (user_id.empty()) {
    throw ragturn::util::InvalidArgument("missing_user_id", "user_id is required");
  }
}

IndexStatusResponse ToProto(const ragturn::retrieval::IndexDiagnostics& diagnostics) {
  IndexStatusResponse resp;
  resp.set_built(diagnostics.built);
  resp.set_build_count(diagnostics.build_count);
  resp.set_last_build_ms(diagnostics.last_build_ms);
  resp.set_built_at_ms(static_cast<int64_t>(diagnostics.built_at_ms));
  resp.set_passage_count(diagnostics.passage_count);
  resp.set_document_count(diagnostics.document_count);
  resp.set_corpus_path(diagnostics.corpus_path);
  resp.set_skipped_lines(diagnostics.skipped_lines);
  return resp;
}

} // namespace

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GrantCreditResponse AdminService::GrantCredit(const GrantCreditRequest& req) {
  return ObserveRpc("AdminService.GrantCredit", [&] {
    RequireUser(req.user_id());
    if (req.amount_cents() <= 0) {
      throw ragturn::util::InvalidArgument("invalid_amount", "amount_cents must be positive");
    }

    std::optional<std::string> reason;
    if (!req.reason().empty()) reason = req.reason();

    GrantCreditResponse resp;
    resp.set_remaining_balance_cents(ctx_.ledger->Grant(req.user_id(), req.amount_cents(), req.actor_user_id(), reason));
    return resp;
  });
}

GetBalanceResponse AdminService::GetBalance(const GetBalanceRequest& req) {
  return ObserveRpc("AdminService.GetBalance", [&] {
    RequireUser(req.user_id());
    const auto balance = ctx_.ledger->Balance(req.user_id());

    GetBalanceResponse resp;
    resp.set_balance_cents(balance.balance_cents);
    resp.set_lifetime_granted_cents(balance.lifetime_granted_cents);
    resp.set_lifetime_spent_cents(balance.lifetime_spent_cents);
    resp.set_updated_at_ms(static_cast<int64_t>(balance.updated_at_ms));
    return resp;
  });
}

ListLedgerEntriesResponse AdminService::ListLedgerEntries(const ListLedgerEntriesRequest& req) {
  return ObserveRpc("AdminService.ListLedgerEntries", [&] {
    RequireUser(req.user_id());

    ListLedgerEntriesResponse resp;
    for (const auto& record : ctx_.ledger->History(req.user_id())) {
      auto* entry = resp.add_entries();
      entry->set_id(static_cast<int64_t>(record.id));
      entry->set_type(ragturn::db::model::ToString(record.type));
      entry->set_amount_cents(record.amount_cents);
      entry->set_request_id(record.request_id);
      entry->set_thread_id(record.thread_id);
      entry->set_message_id(record.message_id);
      entry->set_model_id(record.model_id);
      entry->set_provider(record.provider);
      entry->set_metadata_json(record.metadata_json);
      entry->set_created_at_ms(static_cast<int64_t>(record.created_at_ms));
    }
    return resp;
  });
}

RegisterCredentialResponse AdminService::RegisterCredential(const RegisterCredentialRequest& req) {
  return ObserveRpc("AdminService.RegisterCredential", [&] {
    RequireUser(req.user_id());
    const auto record = ctx_.credentials->Register(req.user_id(), req.provider(), req.label(), req.api_key());

    RegisterCredentialResponse resp;
    resp.set_credential_id(record.id);
    resp.set_key_preview(record.key_preview);
    return resp;
  });
}

SetRetrievalSignalResponse AdminService::SetRetrievalSignal(const SetRetrievalSignalRequest& req) {
  return ObserveRpc("AdminService.SetRetrievalSignal", [&] {
    ragturn::retrieval::SignalInput input;
    input.avg_rating        = req.avg_rating();
    input.rating_count      = req.rating_count();
    input.low_rating_count  = req.low_rating_count();
    input.high_rating_count = req.high_rating_count();

    const auto record = ctx_.weights->RecordSignal(req.chunk_id(), req.doc_id(), input);

    SetRetrievalSignalResponse resp;
    resp.set_confidence(record.confidence);
    resp.set_multiplier(record.multiplier);
    return resp;
  });
}

IndexStatusResponse AdminService::IndexStatus(const IndexStatusRequest&) {
  return ObserveRpc("AdminService.IndexStatus", [&] { return ToProto(ctx_.index_cache->Diagnostics()); });
}

IndexStatusResponse AdminService::RebuildIndex(const RebuildIndexRequest&) {
  return ObserveRpc("AdminService.RebuildIndex", [&] {
    ctx_.index_cache->Rebuild();
    return ToProto(ctx_.index_cache->Diagnostics());
  });
}

} // namespace ragturn::service
