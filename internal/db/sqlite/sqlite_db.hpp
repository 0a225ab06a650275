#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace shopfloor::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema/transaction control)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  // One connection carries one transaction at a time; holders of the lock
  // own the connection until they finish.
  std::unique_lock<std::mutex> LockTransactions() {
    return std::unique_lock<std::mutex>(tx_mutex_);
  }

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

// Creates every table the repository needs; idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace shopfloor::db::sqlite
