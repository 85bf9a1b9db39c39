#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace warehouse::db {

/*
  Outcome of a repository call.

  Every backend maps its native failures (sqlite3 return codes, pqxx
  exceptions, memory-store conflicts) onto ErrorCode; nothing above
  db/ ever sees a backend error type.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // bin id not stored
  AlreadyExists, // bin id already stored
  Busy,          // another writer holds the database

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
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

} // namespace warehouse::db
