#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace shopfloor::db::sqlite {

/*
  Transaction on the shared connection.

  Writers open with BEGIN IMMEDIATE so the write lock is taken up front
  and a busy database fails at Begin() instead of mid-replace. Readers use
  BEGIN DEFERRED with query_only set for their lifetime.

  The connection lock is held until Commit/Rollback/destruction, so a
  thread must not open a second transaction while one is live.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode {
    kReadWrite,
    kReadOnly,
  };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

private:
  void Finish(const char* statement);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  Mode                         mode_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace shopfloor::db::sqlite
