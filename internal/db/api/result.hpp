#pragma once

#include <string>

namespace receiver::db {

/*
  Outcome of a receiver store write.

  Backends translate sqlite rc values and pqxx exceptions into these
  codes; the receiver manager maps them onto util:: errors.

    AlreadyExists         duplicate id, or duplicate name within a project
    NotFound              delete of an id that has no row
    Busy                  write lock still held after the busy timeout
    SerializationFailure  postgres aborted the transaction; retry it
    IOError               disk or connection failure
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  // transient: the write never happened, a retry may succeed
  Busy,
  SerializationFailure,
  IOError,

  ConstraintViolation,
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

  bool IsTransient() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure || code == ErrorCode::IOError;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace receiver::db
