#pragma once

#include <string>
#include <string_view>

namespace shopfloor::db {

// Backend-neutral outcome of a single repository call. SQLite and the
// in-memory store both report through these codes so the scheduling and
// feedback layers never see sqlite3 return values.
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,

  // Lost a write race; the caller may retry on a fresh transaction.
  Conflict,
  Busy,
  SerializationFailure,

  ConstraintViolation,
  ReadOnly,

  IOError,
  Corruption,
  InternalError
};

std::string_view ErrorCodeName(ErrorCode code);

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

// Maps a failed Result onto the util error hierarchy; no-op on success.
void ThrowIfDbError(const Result& result, const std::string& context);

} // namespace shopfloor::db
