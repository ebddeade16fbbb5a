#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/turn_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/turn_service.hpp"
#include "tests/support/turn_fixture.hpp"

namespace {

using ragturn::testing::TurnFixture;

ragturn::service::ServiceContext BuildServiceContext(const TurnFixture& f) {
  ragturn::service::ServiceContext ctx;
  ctx.repository  = f.repo;
  ctx.ledger      = f.ledger;
  ctx.credentials = f.store;
  ctx.index_cache = f.index_cache;
  ctx.weights     = f.weights;
  ctx.turns       = f.orchestrator;
  return ctx;
}

void TestErrorMapping() {
  using namespace ragturn::util;

  auto status = ragturn::grpc::ToStatus(NotFound("thread_not_found", "Thread not found"));
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(status.error_message() == "thread_not_found: Thread not found");

  assert(ragturn::grpc::ToStatus(PermissionDenied("forbidden", "no")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ragturn::grpc::ToStatus(InvalidArgument("missing_content", "no")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ragturn::grpc::ToStatus(UpstreamFailure("provider_request_failed", "no")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ragturn::grpc::ToStatus(CredentialError("decrypt_failed", "no")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ragturn::grpc::ToStatus(InvalidState("index_unavailable", "no")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ragturn::grpc::ToStatus(ConfigurationError("no_models", "no")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ragturn::grpc::ToStatus(StorageError("busy", "no")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ragturn::grpc::ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

void TestInsufficientBalanceCarriesDetail() {
  const auto status = ragturn::grpc::ToStatus(ragturn::util::InsufficientBalance(42));
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(status.error_message() == "insufficient_balance: Insufficient balance for this request.");

  ragturn::v1::InsufficientBalanceDetail detail;
  assert(detail.ParseFromString(status.error_details()));
  assert(detail.remaining_balance_cents() == 42);
}

void TestRunTurnWithoutFundsReturnsResourceExhausted() {
  TurnFixture                 f;
  ragturn::grpc::TurnServer   server(std::make_shared<ragturn::service::TurnService>(BuildServiceContext(f)));
  ::grpc::ServerContext       grpc_ctx;

  ragturn::v1::CreateThreadRequest  create;
  ragturn::v1::CreateThreadResponse created;
  create.set_user_id("owner");
  assert(server.CreateThread(&grpc_ctx, &create, &created).ok());

  ragturn::v1::RunTurnRequest  req;
  ragturn::v1::RunTurnResponse resp;
  req.set_user_id("owner");
  req.set_thread_id(created.thread_id());
  req.set_content("reset password");

  const auto status = server.RunTurn(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(f.provider->calls == 0);
}

void TestRunTurnOnMissingThreadReturnsNotFound() {
  TurnFixture               f;
  ragturn::grpc::TurnServer server(std::make_shared<ragturn::service::TurnService>(BuildServiceContext(f)));
  ::grpc::ServerContext     grpc_ctx;

  ragturn::v1::RunTurnRequest  req;
  ragturn::v1::RunTurnResponse resp;
  req.set_user_id("owner");
  req.set_thread_id("missing-thread");
  req.set_content("reset password");

  assert(server.RunTurn(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestProviderFailureReturnsUnavailable() {
  TurnFixture               f;
  ragturn::grpc::TurnServer server(std::make_shared<ragturn::service::TurnService>(BuildServiceContext(f)));
  ::grpc::ServerContext     grpc_ctx;

  const auto thread_id = f.NewThread("owner");
  (void)f.ledger->Grant("owner", 100, "admin", std::nullopt);
  f.provider->fail = true;

  ragturn::v1::RunTurnRequest  req;
  ragturn::v1::RunTurnResponse resp;
  req.set_user_id("owner");
  req.set_thread_id(thread_id);
  req.set_content("reset password");

  const auto status = server.RunTurn(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  // provider detail stays in the log
  assert(status.error_message().find("503") == std::string::npos);
  assert(f.ledger->Balance("owner").balance_cents == 100);
}

void TestGrantWithoutAmountReturnsInvalidArgument() {
  TurnFixture                f;
  ragturn::grpc::AdminServer server(std::make_shared<ragturn::service::AdminService>(BuildServiceContext(f)));
  ::grpc::ServerContext      grpc_ctx;

  ragturn::v1::GrantCreditRequest  req;
  ragturn::v1::GrantCreditResponse resp;
  req.set_user_id("owner");

  assert(server.GrantCredit(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

} // namespace

int main() {
  TestErrorMapping();
  TestInsufficientBalanceCarriesDetail();
  TestRunTurnWithoutFundsReturnsResourceExhausted();
  TestRunTurnOnMissingThreadReturnsNotFound();
  TestProviderFailureReturnsUnavailable();
  TestGrantWithoutAmountReturnsInvalidArgument();

  std::cout << "ragturn_unit_grpc_status: pass\n";
  return 0;
}
