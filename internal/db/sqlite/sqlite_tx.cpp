#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shopfloor::db::sqlite {
namespace {

// Cleanup statements run while another error is already propagating.
void ExecLogged(SqliteDB& db, const char* sql) {
  if (sqlite3_exec(db.Handle(), sql, nullptr, nullptr, nullptr) != SQLITE_OK) {
    SHOPFLOOR_LOG_ERROR("sqlite cleanup statement failed", {observability::StringField("sql", sql), observability::StringField("error", sqlite3_errmsg(db.Handle()))});
  }
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode) : db_(std::move(db)), lock_(db_->LockTransactions()), mode_(mode) {
  if (mode_ == Mode::kReadWrite) {
    db_->Exec("BEGIN IMMEDIATE;");
    return;
  }

  db_->Exec("PRAGMA query_only=1;");
  try {
    db_->Exec("BEGIN DEFERRED;");
  } catch (const std::exception&) {
    ExecLogged(*db_, "PRAGMA query_only=0;");
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    Finish("ROLLBACK;");
  } catch (const std::exception& ex) {
    SHOPFLOOR_LOG_ERROR("sqlite rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", ex.what())});
  }
}

void SqliteTransaction::Finish(const char* statement) {
  finished_ = true;

  std::exception_ptr failure;
  try {
    db_->Exec(statement);
  } catch (const std::exception&) {
    failure = std::current_exception();
  }

  // a failed COMMIT leaves the transaction open on the shared connection
  if (failure && sqlite3_get_autocommit(db_->Handle()) == 0) {
    ExecLogged(*db_, "ROLLBACK;");
  }
  if (mode_ == Mode::kReadOnly) {
    ExecLogged(*db_, "PRAGMA query_only=0;");
  }
  lock_.unlock();

  if (failure) std::rethrow_exception(failure);
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw util::PersistenceFailure("transaction already finished");
  }
  Finish("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  Finish("ROLLBACK;");
}

} // namespace shopfloor::db::sqlite
