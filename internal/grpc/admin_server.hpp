#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "ragturn/v1/admin.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace ragturn::grpc {

class AdminServer final : public ragturn::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<ragturn::service::AdminService> svc);

  ::grpc::Status GrantCredit(::grpc::ServerContext*, const ragturn::v1::GrantCreditRequest*, ragturn::v1::GrantCreditResponse*) override;

  ::grpc::Status GetBalance(::grpc::ServerContext*, const ragturn::v1::GetBalanceRequest*, ragturn::v1::GetBalanceResponse*) override;

  ::grpc::Status ListLedgerEntries(::grpc::ServerContext*, const ragturn::v1::ListLedgerEntriesRequest*,
                                   ragturn::v1::ListLedgerEntriesResponse*) override;

  ::grpc::Status RegisterCredential(::grpc::ServerContext*, const ragturn::v1::RegisterCredentialRequest*,
                                    ragturn::v1::RegisterCredentialResponse*) override;

  ::grpc::Status SetRetrievalSignal(::grpc::ServerContext*, const ragturn::v1::SetRetrievalSignalRequest*,
                                    ragturn::v1::SetRetrievalSignalResponse*) override;

  ::grpc::Status IndexStatus(::grpc::ServerContext*, const ragturn::v1::IndexStatusRequest*, ragturn::v1::IndexStatusResponse*) override;

  ::grpc::Status RebuildIndex(::grpc::ServerContext*, const ragturn::v1::RebuildIndexRequest*, ragturn::v1::IndexStatusResponse*) override;

private:
  std::shared_ptr<ragturn::service::AdminService> service_;
};

}
