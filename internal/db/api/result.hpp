#pragma once

#include <string>

namespace datahub::db {

/*
  Outcome of a repository write.

  Backends map their native failures (sqlite result codes, pqxx exception
  types) onto ErrorCode; ThrowIfDbError turns a failed Result into the
  hub's exception classes.

    AlreadyExists         unique key taken (dataset name, active upload key, part number)
    NotFound              row to update is missing, or a referenced row is
    Conflict / Busy /
    SerializationFailure  concurrent writer; the unit of work may be retried
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  Conflict,
  Busy,
  SerializationFailure,

  ConstraintViolation,
  IOError,
  Corruption,
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

  bool Retryable() const {
    return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace datahub::db
