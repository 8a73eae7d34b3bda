#pragma once

#include <string>

namespace mirrorguard::db {

/*
  Outcome of a single mirror statement.

  Backends map their native failures (sqlite return codes, pqxx
  exceptions) onto ErrorCode; callers decide per call whether a
  code is fatal. NotFound from TouchPost is the usual non-fatal one.
*/
enum class ErrorCode {
  OK = 0,
  NotFound,
  Busy,
  ConstraintViolation,
  SerializationFailure,
  IOError,
  Corruption,
  InternalError,
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace mirrorguard::db
