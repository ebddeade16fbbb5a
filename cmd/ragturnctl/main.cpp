#include <grpcpp/grpcpp.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "ragturn/v1/admin.grpc.pb.h"
#include "ragturn/v1/turn.grpc.pb.h"

using namespace ragturn::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  ragturnctl <addr> create-thread <user_id> [title] [visibility=org|private]\n"
            << "  ragturnctl <addr> ask <user_id> <thread_id> <content> [model_id] [credential_id]\n"
            << "  ragturnctl <addr> grant <user_id> <amount_cents> [actor_user_id] [reason]\n"
            << "  ragturnctl <addr> balance <user_id>\n"
            << "  ragturnctl <addr> ledger <user_id>\n"
            << "  ragturnctl <addr> add-key <user_id> <provider> <label> <api_key>\n"
            << "  ragturnctl <addr> signal <chunk_id> <doc_id> <avg_rating> <rating_count> [low] [high]\n"
            << "  ragturnctl <addr> index-status\n"
            << "  ragturnctl <addr> rebuild-index\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  if (status.error_code() == grpc::StatusCode::RESOURCE_EXHAUSTED && !status.error_details().empty()) {
    InsufficientBalanceDetail detail;
    if (detail.ParseFromString(status.error_details())) {
      std::cerr << "remaining_balance_cents=" << detail.remaining_balance_cents() << "\n";
    }
  }
  return 2;
}

static void PrintIndexStatus(const IndexStatusResponse& resp) {
  std::cout << "built=" << (resp.built() ? "true" : "false") << "\n";
  std::cout << "build_count=" << resp.build_count() << "\n";
  std::cout << "last_build_ms=" << resp.last_build_ms() << "\n";
  std::cout << "passages=" << resp.passage_count() << "\n";
  std::cout << "documents=" << resp.document_count() << "\n";
  std::cout << "skipped_lines=" << resp.skipped_lines() << "\n";
  std::cout << "corpus_path=" << resp.corpus_path() << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto turn_stub  = TurnService::NewStub(channel);
  auto admin_stub = AdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create-thread") {
    if (argc < 4) return 1;

    CreateThreadRequest req;
    req.set_user_id(argv[3]);
    if (argc >= 5) req.set_title(argv[4]);
    if (argc >= 6) req.set_visibility(argv[5]);

    CreateThreadResponse resp;

    auto status = turn_stub->CreateThread(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << resp.thread_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ask") {
    if (argc < 6) return 1;

    RunTurnRequest req;
    req.set_user_id(argv[3]);
    req.set_thread_id(argv[4]);
    req.set_content(argv[5]);
    if (argc >= 7) req.set_model_id(argv[6]);
    if (argc >= 8) req.set_user_credential_id(argv[7]);

    RunTurnResponse resp;

    auto status = turn_stub->RunTurn(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << resp.assistant().content() << "\n\n";
    for (const auto& citation : resp.assistant().citations()) {
      std::cout << "[" << citation.index() << "] " << citation.title() << " " << citation.url() << " (score " << citation.score() << ")\n";
    }
    std::cout << "model=" << resp.assistant().model_id() << "\n";
    std::cout << "charged_cents=" << resp.budget().charged_cents() << "\n";
    std::cout << "remaining_balance_cents=" << resp.budget().remaining_balance_cents() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "grant") {
    if (argc < 5) return 1;

    GrantCreditRequest req;
    req.set_user_id(argv[3]);
    req.set_amount_cents(std::stoll(argv[4]));
    if (argc >= 6) req.set_actor_user_id(argv[5]);
    if (argc >= 7) req.set_reason(argv[6]);

    GrantCreditResponse resp;

    auto status = admin_stub->GrantCredit(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "balance_cents=" << resp.remaining_balance_cents() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "balance") {
    if (argc < 4) return 1;

    GetBalanceRequest req;
    req.set_user_id(argv[3]);

    GetBalanceResponse resp;

    auto status = admin_stub->GetBalance(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "balance_cents=" << resp.balance_cents() << "\n";
    std::cout << "lifetime_granted_cents=" << resp.lifetime_granted_cents() << "\n";
    std::cout << "lifetime_spent_cents=" << resp.lifetime_spent_cents() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "ledger") {
    if (argc < 4) return 1;

    ListLedgerEntriesRequest req;
    req.set_user_id(argv[3]);

    ListLedgerEntriesResponse resp;

    auto status = admin_stub->ListLedgerEntries(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.entries()) {
      std::cout << entry.id() << " " << entry.type() << " " << entry.amount_cents() << " " << entry.request_id() << " "
                << entry.metadata_json() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "add-key") {
    if (argc < 7) return 1;

    RegisterCredentialRequest req;
    req.set_user_id(argv[3]);
    req.set_provider(argv[4]);
    req.set_label(argv[5]);
    req.set_api_key(argv[6]);

    RegisterCredentialResponse resp;

    auto status = admin_stub->RegisterCredential(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << resp.credential_id() << " " << resp.key_preview() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "signal") {
    if (argc < 7) return 1;

    SetRetrievalSignalRequest req;
    req.set_chunk_id(argv[3]);
    req.set_doc_id(argv[4]);
    req.set_avg_rating(std::stod(argv[5]));
    req.set_rating_count(std::stoll(argv[6]));
    if (argc >= 8) req.set_low_rating_count(std::stoll(argv[7]));
    if (argc >= 9) req.set_high_rating_count(std::stoll(argv[8]));

    SetRetrievalSignalResponse resp;

    auto status = admin_stub->SetRetrievalSignal(&ctx, req, &resp);

    if (!status.ok()) return Fail(status);

    std::cout << "confidence=" << resp.confidence() << "\n";
    std::cout << "multiplier=" << resp.multiplier() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "index-status" || cmd == "rebuild-index") {
    IndexStatusResponse resp;

    grpc::Status status;
    if (cmd == "index-status") {
      status = admin_stub->IndexStatus(&ctx, IndexStatusRequest{}, &resp);
    } else {
      status = admin_stub->RebuildIndex(&ctx, RebuildIndexRequest{}, &resp);
    }

    if (!status.ok()) return Fail(status);

    PrintIndexStatus(resp);
    return 0;
  }

  Usage();
  return 1;
}
