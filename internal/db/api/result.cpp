#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace shopfloor::db {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not_found";
    case ErrorCode::AlreadyExists:
      return "already_exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization_failure";
    case ErrorCode::ConstraintViolation:
      return "constraint_violation";
    case ErrorCode::ReadOnly:
      return "read_only";
    case ErrorCode::IOError:
      return "io_error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal_error";
  }
  return "unknown";
}

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " [" + std::string(ErrorCodeName(result.code)) + "]";
  if (!result.message.empty()) message += ": " + result.message;

  if (result.Retryable()) {
    throw util::TransactionConflict(message);
  }
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::ValidationError(util::ValidationErrorKind::kUnknownId, message);
    default:
      throw util::PersistenceFailure(message);
  }
}

} // namespace shopfloor::db
