#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace ragturn::grpc {

namespace {

template <typename Fn>
::grpc::Status Handle(Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<ragturn::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GrantCredit(::grpc::ServerContext*, const ragturn::v1::GrantCreditRequest* req,
                                        ragturn::v1::GrantCreditResponse* resp) {
  return Handle([&] { *resp = service_->GrantCredit(*req); });
}

::grpc::Status AdminServer::GetBalance(::grpc::ServerContext*, const ragturn::v1::GetBalanceRequest* req, ragturn::v1::GetBalanceResponse* resp) {
  return Handle([&] { *resp = service_->GetBalance(*req); });
}

::grpc::Status AdminServer::ListLedgerEntries(::grpc::ServerContext*, const ragturn::v1::ListLedgerEntriesRequest* req,
                                              ragturn::v1::ListLedgerEntriesResponse* resp) {
  return Handle([&] { *resp = service_->ListLedgerEntries(*req); });
}

::grpc::Status AdminServer::RegisterCredential(::grpc::ServerContext*, const ragturn::v1::RegisterCredentialRequest* req,
                                               ragturn::v1::RegisterCredentialResponse* resp) {
  return Handle([&] { *resp = service_->RegisterCredential(*req); });
}

::grpc::Status AdminServer::SetRetrievalSignal(::grpc::ServerContext*, const ragturn::v1::SetRetrievalSignalRequest* req,
                                               ragturn::v1::SetRetrievalSignalResponse* resp) {
  return Handle([&] { *resp = service_->SetRetrievalSignal(*req); });
}

::grpc::Status AdminServer::IndexStatus(::grpc::ServerContext*, const ragturn::v1::IndexStatusRequest* req,
                                        ragturn::v1::IndexStatusResponse* resp) {
  return Handle([&] { *resp = service_->IndexStatus(*req); });
}

::grpc::Status AdminServer::RebuildIndex(::grpc::ServerContext*, const ragturn::v1::RebuildIndexRequest* req,
                                         ragturn::v1::IndexStatusResponse* resp) {
  return Handle([&] { *resp = service_->RebuildIndex(*req); });
}

} // namespace ragturn::grpc
