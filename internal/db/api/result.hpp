#pragma once

#include <string>

namespace debugpod::db {

/*
  Outcome of a journal operation.

  Backends translate their own error codes into ErrorCode; nothing above
  internal/db sees sqlite3 return values.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,            // delete of a correlation id with no row
  ConstraintViolation, // empty key, schema mismatch
  Busy,                // another writer holds the journal past the busy timeout
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

  bool Is(ErrorCode c) const {
    return code == c;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Throws std::runtime_error("<operation>: <code>: <message>") unless ok.
void Check(const Result& result, const std::string& operation);

} // namespace debugpod::db
