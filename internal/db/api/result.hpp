#pragma once

#include <string>
#include <utility>

namespace staging::db {

/*
  Portable result codes shared by the repository and the SQL executors.

  Backends translate their native errors into these; upper layers never
  see sqlite or pqxx error types. NotFound from an executor means the
  target object is already absent.
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

constexpr const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "OK";
    case ErrorCode::NotFound:
      return "NOT_FOUND";
    case ErrorCode::AlreadyExists:
      return "ALREADY_EXISTS";
    case ErrorCode::Conflict:
      return "CONFLICT";
    case ErrorCode::Busy:
      return "BUSY";
    case ErrorCode::ConstraintViolation:
      return "CONSTRAINT_VIOLATION";
    case ErrorCode::SerializationFailure:
      return "SERIALIZATION_FAILURE";
    case ErrorCode::IOError:
      return "IO_ERROR";
    case ErrorCode::Corruption:
      return "CORRUPTION";
    case ErrorCode::Unsupported:
      return "UNSUPPORTED";
    case ErrorCode::InternalError:
      return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

} // namespace staging::db
