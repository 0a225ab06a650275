#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace shopfloor::db::memory {

/*
  Private copy of the committed state plus a version stamp.

  The first write marks the transaction dirty. Commit publishes a dirty
  copy only if no other transaction committed since the copy was taken;
  a clean transaction commits without touching the shared state.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  enum class Mode {
    kReadWrite,
    kReadOnly,
  };

  MemoryTransaction(MemoryRepository& repo, Mode mode);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Throws PersistenceFailure in a read-only or finished transaction.
  MemoryRepository::State& Mutable();

  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  Mode                    mode_;
  std::uint64_t           base_version_ = 0;
  bool                    dirty_        = false;
  bool                    committed_    = false;
  bool                    finished_     = false;
};

} // namespace shopfloor::db::memory
