#include "turn_server.hpp"

#include "grpc_error.hpp"

namespace ragturn::grpc {

TurnServer::TurnServer(std::shared_ptr<ragturn::service::TurnService> svc) : service_(std::move(svc)) {
}

::grpc::Status TurnServer::RunTurn(::grpc::ServerContext*, const ragturn::v1::RunTurnRequest* req, ragturn::v1::RunTurnResponse* resp) {
  try {
    *resp = service_->RunTurn(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status TurnServer::CreateThread(::grpc::ServerContext*, const ragturn::v1::CreateThreadRequest* req,
                                        ragturn::v1::CreateThreadResponse* resp) {
  try {
    *resp = service_->CreateThread(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace ragturn::grpc
