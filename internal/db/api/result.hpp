#pragma once

#include <string>

namespace voicecode::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:                  return "ok";
    case ErrorCode::NotFound:            return "not_found";
    case ErrorCode::AlreadyExists:       return "already_exists";
    case ErrorCode::Conflict:            return "conflict";
    case ErrorCode::Busy:                return "busy";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError:             return "io_error";
    case ErrorCode::Corruption:          return "corruption";
    case ErrorCode::InternalError:       return "internal_error";
  }
  return "unknown";
}

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

} // namespace voicecode::db
