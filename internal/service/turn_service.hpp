#pragma once

#include "ragturn/v1/turn.pb.h"
#include "service_context.hpp"

namespace ragturn::turn {
struct TurnRequest;
struct TurnResult;
} // namespace ragturn::turn

namespace ragturn::service {

class TurnService {
 public:
  explicit TurnService(ServiceContext ctx);

  ragturn::v1::RunTurnResponse RunTurn(const ragturn::v1::RunTurnRequest& req);

  ragturn::v1::CreateThreadResponse CreateThread(const ragturn::v1::CreateThreadRequest& req);

 private:
  ServiceContext ctx_;
};

ragturn::turn::TurnRequest   FromProto(const ragturn::v1::RunTurnRequest& req);
ragturn::v1::RunTurnResponse ToProto(const ragturn::turn::TurnResult& result);

} // namespace ragturn::service
