#pragma once

#include <string>
#include <utility>

namespace engram::db {

/*
  Outcome of a repository call.

  Backends translate sqlite / pqxx failures into these codes so the entity,
  branch and sync layers never see driver types. ThrowIfDbError turns a
  failed Result into the public exception taxonomy.
*/
enum class ErrorCode {
  OK = 0,

  // Branch, pointer or history row lookups.
  NotFound,
  AlreadyExists,

  // A pointer compare-and-swap lost against a concurrent writer.
  Conflict,
  // The backend could not take its write lock in time.
  Busy,
  // The backend aborted a serializable transaction.
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,
  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "io error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
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

  // The caller may re-read and try the write again.
  bool Retryable() const {
    return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace engram::db
