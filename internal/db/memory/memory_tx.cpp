#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace shopfloor::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo, Mode mode) : repo_(repo), mode_(mode) {
  std::scoped_lock lock(repo_.mutex_);
  working_      = repo_.committed_;
  base_version_ = repo_.committed_version_;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (mode_ == Mode::kReadOnly) {
    throw util::PersistenceFailure("write attempted in a read-only transaction");
  }
  if (finished_) {
    throw util::PersistenceFailure("write attempted after the transaction finished");
  }
  dirty_ = true;
  return working_;
}

void MemoryTransaction::Commit() {
  if (finished_) {
    throw util::PersistenceFailure("transaction already finished");
  }
  finished_ = true;
  if (!dirty_) {
    committed_ = true;
    return;
  }

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.committed_version_ != base_version_) {
    throw util::TransactionConflict("another transaction committed since this snapshot was taken");
  }
  repo_.committed_ = std::move(working_);
  ++repo_.committed_version_;
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  finished_ = true;
}

} // namespace shopfloor::db::memory
