#pragma once

#include <string>

namespace tending::db {

/*
  Outcome of one repository write on an instance row.

  Backends map their native failures (sqlite3 result codes, pqxx
  exceptions) onto these; the document store decides which of them the
  caller may retry and turns the rest into storage failures.
*/

enum class ErrorCode {
  OK = 0,

  // Row-level outcomes.
  NotFound,       // update of a sync id that was never inserted
  AlreadyExists,  // insert of a sync id another writer already created
  Conflict,       // concurrent writer won; safe to retry from a fresh read

  // Backend health.
  Busy,
  IOError,
  Corruption,
  InternalError
};

const char* ToString(ErrorCode code);

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
    return code == ErrorCode::AlreadyExists || code == ErrorCode::Conflict;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace tending::db
