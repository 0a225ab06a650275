#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace shopfloor::grpc {

namespace {

const char* ValidationKindName(util::ValidationErrorKind kind) {
  switch (kind) {
    case util::ValidationErrorKind::kInvalidQuantity:
      return "invalid_quantity";
    case util::ValidationErrorKind::kInvalidStep:
      return "invalid_step";
    case util::ValidationErrorKind::kUnknownId:
      return "unknown_id";
    case util::ValidationErrorKind::kInvalidActuals:
      return "invalid_actuals";
    case util::ValidationErrorKind::kForwardDependency:
      return "forward_dependency";
    case util::ValidationErrorKind::kInvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

::grpc::StatusCode CodeFor(const std::exception& e) {
  using namespace shopfloor::util;

  if (dynamic_cast<const NotFound*>(&e)) return ::grpc::StatusCode::NOT_FOUND;
  if (dynamic_cast<const ValidationError*>(&e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (dynamic_cast<const GraphError*>(&e)) return ::grpc::StatusCode::INVALID_ARGUMENT;
  if (dynamic_cast<const ConcurrencyConflict*>(&e)) return ::grpc::StatusCode::ABORTED;
  if (dynamic_cast<const DeadlineExceeded*>(&e)) return ::grpc::StatusCode::DEADLINE_EXCEEDED;
  // Includes TransactionConflict that survived the write retries.
  if (dynamic_cast<const PersistenceFailure*>(&e)) return ::grpc::StatusCode::UNAVAILABLE;
  return ::grpc::StatusCode::INTERNAL;
}

} // namespace

std::string ErrorTag(const std::exception& e) {
  using namespace shopfloor::util;

  if (dynamic_cast<const NotFound*>(&e)) return "not_found";
  if (const auto* v = dynamic_cast<const ValidationError*>(&e)) {
    return std::string("validation.") + ValidationKindName(v->kind());
  }
  if (const auto* g = dynamic_cast<const GraphError*>(&e)) {
    return g->kind() == GraphErrorKind::kCycle ? "graph.cycle" : "graph.dangling_dependency";
  }
  if (dynamic_cast<const ConcurrencyConflict*>(&e)) return "concurrency_conflict";
  if (dynamic_cast<const DeadlineExceeded*>(&e)) return "deadline_exceeded";
  if (dynamic_cast<const TransactionConflict*>(&e)) return "persistence.conflict";
  if (dynamic_cast<const PersistenceFailure*>(&e)) return "persistence";
  return "internal";
}

::grpc::Status ToStatus(const std::exception& e) {
  return {CodeFor(e), e.what(), ErrorTag(e)};
}

} // namespace shopfloor::grpc
