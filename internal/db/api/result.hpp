#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace ragturn::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on pqxx/sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,

  Unsupported,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::Unsupported: return "unsupported";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "internal_error";
}

// Raises util::StorageError for any non-OK result. `what` names the operation.
inline void ThrowIfDbError(const Result& result, std::string_view what) {
  if (result) {
    return;
  }
  std::string message(what);
  message += " failed (";
  message += ToString(result.code);
  message += ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  throw util::StorageError(ToString(result.code), message);
}

} // namespace ragturn::db
