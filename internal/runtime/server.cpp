#include "server.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Shutdown();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials());

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw ragturn::util::ConfigurationError("listen_failed", "failed to start gRPC server on " + bind_address_);
  }

  RAGTURN_LOG_INFO("ragturn listening", {ragturn::observability::StringField("bind_address", bind_address_),
                                         ragturn::observability::IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Shutdown() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
  }
}

} // namespace ragturn::runtime
