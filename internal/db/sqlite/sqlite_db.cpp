#include "sqlite_db.hpp"

#include <vector>

#include "internal/util/errors.hpp"

namespace shopfloor::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc == SQLITE_OK) {
    return;
  }
  const std::string msg = what + ": " + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
    throw util::TransactionConflict(msg);
  }
  throw util::PersistenceFailure(msg);
}

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::PersistenceFailure("open " + path_ + ": " + msg);
  }

  Configure(wal_mode);
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
      throw util::TransactionConflict(msg);
    }
    throw util::PersistenceFailure(msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets analyzer reads proceed while a schedule replace holds the write lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }
  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; schedule replace relies on cascades
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

void BootstrapSchema(SqliteDB& db) {
  // Dates are stored as days since the unix epoch, times as seconds since midnight.
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS orders (id INTEGER PRIMARY KEY, product_id INTEGER NOT NULL, quantity INTEGER NOT NULL, due_date INTEGER NOT NULL, status INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS product_steps (id INTEGER PRIMARY KEY, product_id INTEGER NOT NULL, name TEXT NOT NULL, sequence INTEGER NOT NULL, category INTEGER NOT NULL, required_skill INTEGER NOT NULL, time_per_piece_seconds INTEGER NOT NULL, equipment_id INTEGER);",
      "CREATE INDEX IF NOT EXISTS product_steps_by_product ON product_steps(product_id, sequence, id);",
      "CREATE TABLE IF NOT EXISTS step_dependencies (step_id INTEGER NOT NULL REFERENCES product_steps(id) ON DELETE CASCADE, depends_on INTEGER NOT NULL, PRIMARY KEY (step_id, depends_on));",
      "CREATE TABLE IF NOT EXISTS workers (id INTEGER PRIMARY KEY, name TEXT NOT NULL, status INTEGER NOT NULL, skill INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS equipment (id INTEGER PRIMARY KEY, name TEXT NOT NULL, status INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS certifications (worker_id INTEGER NOT NULL REFERENCES workers(id), equipment_id INTEGER NOT NULL REFERENCES equipment(id), expires_on INTEGER);",
      "CREATE TABLE IF NOT EXISTS proficiencies (worker_id INTEGER NOT NULL REFERENCES workers(id), step_id INTEGER NOT NULL, level INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, PRIMARY KEY (worker_id, step_id));",
      "CREATE TABLE IF NOT EXISTS proficiency_history (id INTEGER PRIMARY KEY AUTOINCREMENT, worker_id INTEGER NOT NULL, step_id INTEGER NOT NULL, old_level INTEGER NOT NULL, new_level INTEGER NOT NULL, reason INTEGER NOT NULL, average_efficiency REAL, sample_size INTEGER NOT NULL, recorded_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS schedules (id INTEGER PRIMARY KEY AUTOINCREMENT, order_id INTEGER NOT NULL UNIQUE REFERENCES orders(id), start_date INTEGER NOT NULL, generated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS schedule_entries (id INTEGER PRIMARY KEY AUTOINCREMENT, schedule_id INTEGER NOT NULL REFERENCES schedules(id) ON DELETE CASCADE, order_id INTEGER NOT NULL, step_id INTEGER NOT NULL, date INTEGER NOT NULL, start_second INTEGER NOT NULL, end_second INTEGER NOT NULL, planned_output INTEGER NOT NULL, status INTEGER NOT NULL, actual_start_second INTEGER, actual_end_second INTEGER, actual_output INTEGER, completed_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS schedule_entries_by_schedule ON schedule_entries(schedule_id, date, start_second, id);",
      "CREATE TABLE IF NOT EXISTS entry_assignments (entry_id INTEGER NOT NULL REFERENCES schedule_entries(id) ON DELETE CASCADE, position INTEGER NOT NULL, worker_id INTEGER NOT NULL, planned_output INTEGER NOT NULL, PRIMARY KEY (entry_id, position));",
      "CREATE INDEX IF NOT EXISTS entry_assignments_by_worker ON entry_assignments(worker_id, entry_id);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }
}

} // namespace shopfloor::db::sqlite
