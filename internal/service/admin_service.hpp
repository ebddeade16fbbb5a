#pragma once

#include "ragturn/v1/admin.pb.h"
#include "service_context.hpp"

namespace ragturn::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  ragturn::v1::GrantCreditResponse GrantCredit(const ragturn::v1::GrantCreditRequest& req);

  ragturn::v1::GetBalanceResponse GetBalance(const ragturn::v1::GetBalanceRequest& req);

  ragturn::v1::ListLedgerEntriesResponse ListLedgerEntries(const ragturn::v1::ListLedgerEntriesRequest& req);

  ragturn::v1::RegisterCredentialResponse RegisterCredential(const ragturn::v1::RegisterCredentialRequest& req);

  ragturn::v1::SetRetrievalSignalResponse SetRetrievalSignal(const ragturn::v1::SetRetrievalSignalRequest& req);

  ragturn::v1::IndexStatusResponse IndexStatus(const ragturn::v1::IndexStatusRequest& req);

  ragturn::v1::IndexStatusResponse RebuildIndex(const ragturn::v1::RebuildIndexRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace ragturn::service
