#pragma once

namespace shopfloor::db {

/*
  Unit of work against a Repository.

  - Nothing is visible to other transactions until Commit()
  - Rollback(), or destruction without Commit(), discards every write
  - Commit() throws util::TransactionConflict when a concurrent writer
    committed first; callers retry through db::WithWriteRetry
  - Read transactions (Repository::BeginRead) reject writes and never
    conflict; Commit() on them only ends the transaction

  Memory: copy-on-write snapshot with a version check at commit
  SQLite: BEGIN IMMEDIATE for writers, BEGIN DEFERRED + query_only for readers
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace shopfloor::db
