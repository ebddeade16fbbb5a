#include "grpc_error.hpp"

#include <string>

#include "ragturn/v1/turn.pb.h"

namespace ragturn::grpc {

namespace {

std::string Describe(const ragturn::util::Error& e) {
  return e.code() + ": " + e.what();
}

} // namespace

::grpc::Status ToStatus(const std::exception& e) {
  using namespace ragturn::util;

  if (const auto* funding = dynamic_cast<const InsufficientBalance*>(&e)) {
    ragturn::v1::InsufficientBalanceDetail detail;
    detail.set_remaining_balance_cents(funding->remaining_cents());
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, Describe(*funding), detail.SerializeAsString()};
  }

  const auto* typed = dynamic_cast<const Error*>(&e);
  if (!typed) {
    return {::grpc::StatusCode::INTERNAL, e.what()};
  }

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, Describe(*typed)};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, Describe(*typed)};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, Describe(*typed)};
  }
  if (dynamic_cast<const UpstreamFailure*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, Describe(*typed)};
  }
  if (dynamic_cast<const CredentialError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, Describe(*typed)};
  }
  if (dynamic_cast<const InvalidState*>(&e) || dynamic_cast<const ConfigurationError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, Describe(*typed)};
  }

  return {::grpc::StatusCode::INTERNAL, Describe(*typed)};
}

} // namespace ragturn::grpc
