#pragma once

#include <string>
#include <string_view>

namespace bazaar::db {

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
  Unavailable,
  Corruption,

  Unsupported,
  Aborted,
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

// Connection drops, lock contention and I/O hiccups: the same request may
// succeed if issued again.
constexpr bool IsTransient(ErrorCode code) {
  return code == ErrorCode::Busy || code == ErrorCode::IOError || code == ErrorCode::Unavailable ||
         code == ErrorCode::SerializationFailure;
}

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::NotFound: return "not_found";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::Conflict: return "conflict";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Unavailable: return "unavailable";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::Unsupported: return "unsupported";
    case ErrorCode::Aborted: return "aborted";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "unknown";
}

} // namespace bazaar::db
