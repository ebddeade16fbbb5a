#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace ragturn::util {

/*
  Central error types.

  Each carries a stable machine-readable code next to the human message.
  These get translated later to gRPC status codes.
*/

class Error : public std::runtime_error {
 public:
  Error(std::string code, const std::string& msg) : std::runtime_error(msg), code_(std::move(code)) {
  }

  const std::string& code() const noexcept {
    return code_;
  }

 private:
  std::string code_;
};

class NotFound : public Error {
 public:
  NotFound(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class PermissionDenied : public Error {
 public:
  PermissionDenied(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class InvalidArgument : public Error {
 public:
  InvalidArgument(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class InvalidState : public Error {
 public:
  InvalidState(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

// Funding failure. Carries the balance observed when the reservation was refused.
class InsufficientBalance : public Error {
 public:
  explicit InsufficientBalance(std::int64_t remaining_cents)
      : Error("insufficient_balance", "Insufficient balance for this request."), remaining_cents_(remaining_cents) {
  }

  std::int64_t remaining_cents() const noexcept {
    return remaining_cents_;
  }

 private:
  std::int64_t remaining_cents_;
};

// Upstream model provider failed. The message never carries provider internals.
class UpstreamFailure : public Error {
 public:
  UpstreamFailure(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

// Stored personal credential could not be used (decryption, format).
class CredentialError : public Error {
 public:
  CredentialError(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

class ConfigurationError : public Error {
 public:
  ConfigurationError(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

// Storage layer failure surfaced to callers (see db::ThrowIfDbError).
class StorageError : public Error {
 public:
  StorageError(std::string code, const std::string& msg) : Error(std::move(code), msg) {
  }
};

} // namespace ragturn::util
