#pragma once

#include <stdexcept>
#include <string>

namespace shopfloor::util {

/*
  Central error types.

  These get translated later to gRPC status codes. Structural errors
  (validation, graph) are raised before any repository write.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class ValidationErrorKind {
  kInvalidQuantity,
  kInvalidStep,
  kUnknownId,
  kInvalidActuals,
  kForwardDependency,
  kInvalidArgument,
};

class ValidationError : public std::runtime_error {
 public:
  ValidationError(ValidationErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  ValidationErrorKind kind() const {
    return kind_;
  }

 private:
  ValidationErrorKind kind_;
};

enum class GraphErrorKind {
  kCycle,
  kDanglingDependency,
};

class GraphError : public std::runtime_error {
 public:
  GraphError(GraphErrorKind kind, const std::string& msg) : std::runtime_error(msg), kind_(kind) {
  }

  GraphErrorKind kind() const {
    return kind_;
  }

 private:
  GraphErrorKind kind_;
};

// Another generation for the same order is in flight.
class ConcurrencyConflict : public std::runtime_error {
 public:
  explicit ConcurrencyConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceFailure : public std::runtime_error {
 public:
  explicit PersistenceFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Retriable: the repository state moved underneath an open transaction.
class TransactionConflict : public PersistenceFailure {
 public:
  explicit TransactionConflict(const std::string& msg) : PersistenceFailure(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace shopfloor::util
