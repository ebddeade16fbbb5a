#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "ragturn/v1/turn.grpc.pb.h"
#include "internal/service/turn_service.hpp"

namespace ragturn::grpc {

class TurnServer final : public ragturn::v1::TurnService::Service {
public:
  explicit TurnServer(std::shared_ptr<ragturn::service::TurnService> svc);

  ::grpc::Status RunTurn(::grpc::ServerContext*, const ragturn::v1::RunTurnRequest*, ragturn::v1::RunTurnResponse*) override;

  ::grpc::Status CreateThread(::grpc::ServerContext*, const ragturn::v1::CreateThreadRequest*, ragturn::v1::CreateThreadResponse*) override;

private:
  std::shared_ptr<ragturn::service::TurnService> service_;
};

}
