#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <tuple>
#include <type_traits>

#include "internal/util/errors.hpp"

namespace shopfloor::db::sqlite {

using shopfloor::db::ErrorCode;
using shopfloor::db::Result;

namespace {

// Finalizes on scope exit; prepare errors are reported through ok().
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool ok() const {
    return rc_ == SQLITE_OK;
  }
  sqlite3_stmt* get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

 private:
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, std::uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDate(sqlite3_stmt* st, int idx, util::Date date) {
  sqlite3_bind_int64(st, idx, date.time_since_epoch().count());
}

// 0 binds NULL, for optional foreign keys and explicit-id inserts.
void BindIdOrNull(sqlite3_stmt* st, int idx, std::uint64_t id) {
  if (id == 0) {
    sqlite3_bind_null(st, idx);
  } else {
    BindU64(st, idx, id);
  }
}

template <typename T>
void BindOptional(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (!v) {
    sqlite3_bind_null(st, idx);
  } else if constexpr (std::is_floating_point_v<T>) {
    sqlite3_bind_double(st, idx, *v);
  } else {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<std::uint64_t>(sqlite3_column_int64(st, col));
}

std::int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<std::int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

util::Date ColDate(sqlite3_stmt* st, int col) {
  return util::Date{std::chrono::days{sqlite3_column_int64(st, col)}};
}

[[noreturn]] void ThrowRead(sqlite3* db, const std::string& what) {
  throw util::PersistenceFailure(what + ": " + sqlite3_errmsg(db));
}

void RequireDone(sqlite3* db, int rc, const std::string& what) {
  if (rc != SQLITE_DONE) ThrowRead(db, what);
}

constexpr const char* kEntryColumns =
    "e.id,e.schedule_id,e.order_id,e.step_id,e.date,e.start_second,e.end_second,e.planned_output,e.status,"
    "e.actual_start_second,e.actual_end_second,e.actual_output,e.completed_at_ms";

model::ScheduleEntry ReadEntry(sqlite3_stmt* st) {
  model::ScheduleEntry e;
  e.id             = ColU64(st, 0);
  e.schedule_id    = ColU64(st, 1);
  e.order_id       = ColU64(st, 2);
  e.step_id        = ColU64(st, 3);
  e.date           = ColDate(st, 4);
  e.start_second   = ColI32(st, 5);
  e.end_second     = ColI32(st, 6);
  e.planned_output = ColI64(st, 7);
  e.status         = static_cast<model::EntryStatus>(ColI32(st, 8));
  if (!ColIsNull(st, 9)) e.actual_start_second = ColI32(st, 9);
  if (!ColIsNull(st, 10)) e.actual_end_second = ColI32(st, 10);
  if (!ColIsNull(st, 11)) e.actual_output = ColI64(st, 11);
  e.completed_at_ms = ColU64(st, 12);
  return e;
}

model::Worker ReadWorker(sqlite3_stmt* st) {
  model::Worker w;
  w.id     = ColU64(st, 0);
  w.name   = ColText(st, 1);
  w.status = static_cast<model::WorkerStatus>(ColI32(st, 2));
  w.skill  = static_cast<model::SkillCategory>(ColI32(st, 3));
  return w;
}

model::Order ReadOrder(sqlite3_stmt* st) {
  model::Order o;
  o.id         = ColU64(st, 0);
  o.product_id = ColU64(st, 1);
  o.quantity   = ColI64(st, 2);
  o.due_date   = ColDate(st, 3);
  o.status     = static_cast<model::OrderStatus>(ColI32(st, 4));
  return o;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kReadWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kReadOnly);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_READONLY:
      return Result::Err(ErrorCode::ReadOnly, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Orders and steps
// ------------------------------------------------------------------

Result SqliteRepository::InsertOrder(Transaction& t, model::Order& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO orders(id,product_id,quantity,due_date,status) VALUES(?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindIdOrNull(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.product_id);
  BindI64(st.get(), 3, r.quantity);
  BindDate(st.get(), 4, r.due_date);
  BindI32(st.get(), 5, static_cast<int>(r.status));

  auto result = Translate(db, st.Step());
  if (result) r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
  return result;
}

std::optional<model::Order> SqliteRepository::GetOrder(Transaction& t, std::uint64_t id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,product_id,quantity,due_date,status FROM orders WHERE id=?;");
  if (!st.ok()) ThrowRead(db, "get order");

  BindU64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadOrder(st.get());
}

std::vector<model::Order> SqliteRepository::ListOrders(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,product_id,quantity,due_date,status FROM orders ORDER BY id;");
  if (!st.ok()) ThrowRead(db, "list orders");

  std::vector<model::Order> out;
  int                       rc;
  while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadOrder(st.get()));
  RequireDone(db, rc, "list orders");
  return out;
}

Result SqliteRepository::UpdateOrderStatus(Transaction& t, std::uint64_t id, model::OrderStatus status) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE orders SET status=? WHERE id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(status));
  BindU64(st.get(), 2, id);
  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "order " + std::to_string(id));
  return result;
}

Result SqliteRepository::InsertStep(Transaction& t, model::Step& r) {
  auto* db = TX(t).Handle();
  {
    Statement st(db,
                 "INSERT INTO product_steps(id,product_id,name,sequence,category,required_skill,time_per_piece_seconds,equipment_id) "
                 "VALUES(?,?,?,?,?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindIdOrNull(st.get(), 1, r.id);
    BindU64(st.get(), 2, r.product_id);
    BindText(st.get(), 3, r.name);
    BindI32(st.get(), 4, r.sequence);
    BindI32(st.get(), 5, static_cast<int>(r.category));
    BindI32(st.get(), 6, static_cast<int>(r.required_skill));
    BindI64(st.get(), 7, r.time_per_piece_seconds);
    BindOptional(st.get(), 8, r.equipment_id);

    auto result = Translate(db, st.Step());
    if (!result) {
      if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
      return result;
    }
    r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  }

  for (auto dependency : r.dependencies) {
    Statement st(db, "INSERT OR IGNORE INTO step_dependencies(step_id,depends_on) VALUES(?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, r.id);
    BindU64(st.get(), 2, dependency);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

namespace {

constexpr const char* kStepColumns = "id,product_id,name,sequence,category,required_skill,time_per_piece_seconds,equipment_id";

model::Step ReadStep(sqlite3_stmt* st) {
  model::Step s;
  s.id                     = ColU64(st, 0);
  s.product_id             = ColU64(st, 1);
  s.name                   = ColText(st, 2);
  s.sequence               = ColI32(st, 3);
  s.category               = static_cast<model::StepCategory>(ColI32(st, 4));
  s.required_skill         = static_cast<model::SkillCategory>(ColI32(st, 5));
  s.time_per_piece_seconds = ColI64(st, 6);
  if (!ColIsNull(st, 7)) s.equipment_id = ColU64(st, 7);
  return s;
}

void LoadDependencies(sqlite3* db, model::Step& step) {
  Statement st(db, "SELECT depends_on FROM step_dependencies WHERE step_id=? ORDER BY depends_on;");
  if (!st.ok()) ThrowRead(db, "list step dependencies");
  BindU64(st.get(), 1, step.id);

  int rc;
  while ((rc = st.Step()) == SQLITE_ROW) step.dependencies.push_back(ColU64(st.get(), 0));
  RequireDone(db, rc, "list step dependencies");
}

} // namespace

std::optional<model::Step> SqliteRepository::GetStep(Transaction& t, std::uint64_t step_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kStepColumns + " FROM product_steps WHERE id=?;";

  std::optional<model::Step> step;
  {
    Statement st(db, sql.c_str());
    if (!st.ok()) ThrowRead(db, "get step");
    BindU64(st.get(), 1, step_id);
    if (st.Step() != SQLITE_ROW) return std::nullopt;
    step = ReadStep(st.get());
  }
  LoadDependencies(db, *step);
  return step;
}

std::vector<model::Step> SqliteRepository::ListSteps(Transaction& t, std::uint64_t product_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kStepColumns + " FROM product_steps WHERE product_id=? ORDER BY sequence,id;";

  std::vector<model::Step> out;
  {
    Statement st(db, sql.c_str());
    if (!st.ok()) ThrowRead(db, "list steps");
    BindU64(st.get(), 1, product_id);

    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadStep(st.get()));
    RequireDone(db, rc, "list steps");
  }

  for (auto& step : out) LoadDependencies(db, step);
  return out;
}

// ------------------------------------------------------------------
// Workforce and equipment
// ------------------------------------------------------------------

Result SqliteRepository::InsertWorker(Transaction& t, model::Worker& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO workers(id,name,status,skill) VALUES(?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindIdOrNull(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindI32(st.get(), 3, static_cast<int>(r.status));
  BindI32(st.get(), 4, static_cast<int>(r.skill));

  auto result = Translate(db, st.Step());
  if (result) r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
  return result;
}

Result SqliteRepository::UpdateWorker(Transaction& t, const model::Worker& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "UPDATE workers SET name=?,status=?,skill=? WHERE id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.name);
  BindI32(st.get(), 2, static_cast<int>(r.status));
  BindI32(st.get(), 3, static_cast<int>(r.skill));
  BindU64(st.get(), 4, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "worker " + std::to_string(r.id));
  return result;
}

std::optional<model::Worker> SqliteRepository::GetWorker(Transaction& t, std::uint64_t id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,name,status,skill FROM workers WHERE id=?;");
  if (!st.ok()) ThrowRead(db, "get worker");

  BindU64(st.get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadWorker(st.get());
}

std::vector<model::Worker> SqliteRepository::ListWorkers(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,name,status,skill FROM workers ORDER BY id;");
  if (!st.ok()) ThrowRead(db, "list workers");

  std::vector<model::Worker> out;
  int                        rc;
  while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadWorker(st.get()));
  RequireDone(db, rc, "list workers");
  return out;
}

Result SqliteRepository::InsertEquipment(Transaction& t, model::Equipment& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO equipment(id,name,status) VALUES(?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindIdOrNull(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindI32(st.get(), 3, static_cast<int>(r.status));

  auto result = Translate(db, st.Step());
  if (result) r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::AlreadyExists;
  return result;
}

std::vector<model::Equipment> SqliteRepository::ListEquipment(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT id,name,status FROM equipment ORDER BY id;");
  if (!st.ok()) ThrowRead(db, "list equipment");

  std::vector<model::Equipment> out;
  int                           rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    model::Equipment e;
    e.id     = ColU64(st.get(), 0);
    e.name   = ColText(st.get(), 1);
    e.status = static_cast<model::EquipmentStatus>(ColI32(st.get(), 2));
    out.push_back(std::move(e));
  }
  RequireDone(db, rc, "list equipment");
  return out;
}

Result SqliteRepository::InsertCertification(Transaction& t, const model::Certification& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, "INSERT INTO certifications(worker_id,equipment_id,expires_on) VALUES(?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.worker_id);
  BindU64(st.get(), 2, r.equipment_id);
  if (r.expires_on) {
    BindDate(st.get(), 3, *r.expires_on);
  } else {
    sqlite3_bind_null(st.get(), 3);
  }
  return Translate(db, st.Step());
}

std::vector<model::Certification> SqliteRepository::ListCertifications(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT worker_id,equipment_id,expires_on FROM certifications ORDER BY rowid;");
  if (!st.ok()) ThrowRead(db, "list certifications");

  std::vector<model::Certification> out;
  int                               rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    model::Certification c;
    c.worker_id    = ColU64(st.get(), 0);
    c.equipment_id = ColU64(st.get(), 1);
    if (!ColIsNull(st.get(), 2)) c.expires_on = ColDate(st.get(), 2);
    out.push_back(c);
  }
  RequireDone(db, rc, "list certifications");
  return out;
}

// ------------------------------------------------------------------
// Proficiency
// ------------------------------------------------------------------

std::optional<model::Proficiency> SqliteRepository::GetProficiency(Transaction& t, std::uint64_t worker_id, std::uint64_t step_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT worker_id,step_id,level,updated_at_ms FROM proficiencies WHERE worker_id=? AND step_id=?;");
  if (!st.ok()) ThrowRead(db, "get proficiency");

  BindU64(st.get(), 1, worker_id);
  BindU64(st.get(), 2, step_id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::Proficiency p;
  p.worker_id     = ColU64(st.get(), 0);
  p.step_id       = ColU64(st.get(), 1);
  p.level         = ColI32(st.get(), 2);
  p.updated_at_ms = ColU64(st.get(), 3);
  return p;
}

std::vector<model::Proficiency> SqliteRepository::ListProficiencies(Transaction& t) {
  auto*     db = TX(t).Handle();
  Statement st(db, "SELECT worker_id,step_id,level,updated_at_ms FROM proficiencies ORDER BY worker_id,step_id;");
  if (!st.ok()) ThrowRead(db, "list proficiencies");

  std::vector<model::Proficiency> out;
  int                             rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    model::Proficiency p;
    p.worker_id     = ColU64(st.get(), 0);
    p.step_id       = ColU64(st.get(), 1);
    p.level         = ColI32(st.get(), 2);
    p.updated_at_ms = ColU64(st.get(), 3);
    out.push_back(p);
  }
  RequireDone(db, rc, "list proficiencies");
  return out;
}

Result SqliteRepository::UpsertProficiency(Transaction& t, const model::Proficiency& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO proficiencies(worker_id,step_id,level,updated_at_ms) VALUES(?,?,?,?) "
               "ON CONFLICT(worker_id,step_id) DO UPDATE SET level=excluded.level, updated_at_ms=excluded.updated_at_ms;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.worker_id);
  BindU64(st.get(), 2, r.step_id);
  BindI32(st.get(), 3, r.level);
  BindU64(st.get(), 4, r.updated_at_ms);

  auto result = Translate(db, st.Step());
  // the only constraint on this table is the worker foreign key
  if (result.code == ErrorCode::ConstraintViolation) result.code = ErrorCode::NotFound;
  return result;
}

Result SqliteRepository::AppendProficiencyHistory(Transaction& t, model::ProficiencyHistory& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO proficiency_history(worker_id,step_id,old_level,new_level,reason,average_efficiency,sample_size,recorded_at_ms) "
               "VALUES(?,?,?,?,?,?,?,?);");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.worker_id);
  BindU64(st.get(), 2, r.step_id);
  BindI32(st.get(), 3, r.old_level);
  BindI32(st.get(), 4, r.new_level);
  BindI32(st.get(), 5, static_cast<int>(r.reason));
  BindOptional(st.get(), 6, r.average_efficiency);
  BindI32(st.get(), 7, r.sample_size);
  BindU64(st.get(), 8, r.recorded_at_ms);

  auto result = Translate(db, st.Step());
  if (result) r.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::ProficiencyHistory> SqliteRepository::ListProficiencyHistory(Transaction& t, std::uint64_t worker_id) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT id,worker_id,step_id,old_level,new_level,reason,average_efficiency,sample_size,recorded_at_ms "
               "FROM proficiency_history WHERE worker_id=? ORDER BY id;");
  if (!st.ok()) ThrowRead(db, "list proficiency history");
  BindU64(st.get(), 1, worker_id);

  std::vector<model::ProficiencyHistory> out;
  int                                    rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    model::ProficiencyHistory h;
    h.id        = ColU64(st.get(), 0);
    h.worker_id = ColU64(st.get(), 1);
    h.step_id   = ColU64(st.get(), 2);
    h.old_level = ColI32(st.get(), 3);
    h.new_level = ColI32(st.get(), 4);
    h.reason    = static_cast<model::ProficiencyReason>(ColI32(st.get(), 5));
    if (!ColIsNull(st.get(), 6)) h.average_efficiency = sqlite3_column_double(st.get(), 6);
    h.sample_size    = ColI32(st.get(), 7);
    h.recorded_at_ms = ColU64(st.get(), 8);
    out.push_back(h);
  }
  RequireDone(db, rc, "list proficiency history");
  return out;
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result SqliteRepository::LoadAssignments(sqlite3* db, model::ScheduleEntry& entry) {
  Statement st(db, "SELECT worker_id,planned_output FROM entry_assignments WHERE entry_id=? ORDER BY position;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(st.get(), 1, entry.id);

  int rc;
  while ((rc = st.Step()) == SQLITE_ROW) {
    entry.assignments.push_back({ColU64(st.get(), 0), ColI64(st.get(), 1)});
  }
  return Translate(db, rc);
}

std::vector<model::ScheduleEntry> SqliteRepository::QueryEntries(sqlite3* db, const char* sql, std::uint64_t a, std::uint64_t b,
                                                                  int bind_count) {
  std::vector<model::ScheduleEntry> out;
  {
    Statement st(db, sql);
    if (!st.ok()) ThrowRead(db, "query entries");
    if (bind_count > 0) BindU64(st.get(), 1, a);
    if (bind_count > 1) BindU64(st.get(), 2, b);

    int rc;
    while ((rc = st.Step()) == SQLITE_ROW) out.push_back(ReadEntry(st.get()));
    RequireDone(db, rc, "query entries");
  }

  for (auto& entry : out) {
    auto result = LoadAssignments(db, entry);
    if (!result) ThrowRead(db, "load assignments");
  }
  return out;
}

std::optional<model::Schedule> SqliteRepository::LoadSchedule(sqlite3* db, const char* header_sql, std::uint64_t key) {
  model::Schedule schedule;
  {
    Statement st(db, header_sql);
    if (!st.ok()) ThrowRead(db, "get schedule");
    BindU64(st.get(), 1, key);
    if (st.Step() != SQLITE_ROW) return std::nullopt;

    schedule.id              = ColU64(st.get(), 0);
    schedule.order_id        = ColU64(st.get(), 1);
    schedule.start_date      = ColDate(st.get(), 2);
    schedule.generated_at_ms = ColU64(st.get(), 3);
  }

  const std::string sql =
      std::string("SELECT ") + kEntryColumns + " FROM schedule_entries e WHERE e.schedule_id=? ORDER BY e.date,e.start_second,e.id;";
  schedule.entries = QueryEntries(db, sql.c_str(), schedule.id, 0, 1);
  return schedule;
}

Result SqliteRepository::ReplaceSchedule(Transaction& t, model::Schedule& schedule) {
  auto* db = TX(t).Handle();

  {
    Statement st(db, "SELECT 1 FROM orders WHERE id=?;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, schedule.order_id);
    if (st.Step() != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "order " + std::to_string(schedule.order_id));
  }

  {
    // entries and assignments follow through ON DELETE CASCADE
    Statement st(db, "DELETE FROM schedules WHERE order_id=?;");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, schedule.order_id);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }

  {
    Statement st(db, "INSERT INTO schedules(order_id,start_date,generated_at_ms) VALUES(?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(st.get(), 1, schedule.order_id);
    BindDate(st.get(), 2, schedule.start_date);
    BindU64(st.get(), 3, schedule.generated_at_ms);
    auto result = Translate(db, st.Step());
    if (!result) return result;
    schedule.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));
  }

  for (auto& entry : schedule.entries) {
    entry.schedule_id = schedule.id;
    entry.order_id    = schedule.order_id;

    Statement st(db,
                 "INSERT INTO schedule_entries(id,schedule_id,order_id,step_id,date,start_second,end_second,planned_output,status,"
                 "actual_start_second,actual_end_second,actual_output,completed_at_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);");
    if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindIdOrNull(st.get(), 1, entry.id);
    BindU64(st.get(), 2, entry.schedule_id);
    BindU64(st.get(), 3, entry.order_id);
    BindU64(st.get(), 4, entry.step_id);
    BindDate(st.get(), 5, entry.date);
    BindI32(st.get(), 6, entry.start_second);
    BindI32(st.get(), 7, entry.end_second);
    BindI64(st.get(), 8, entry.planned_output);
    BindI32(st.get(), 9, static_cast<int>(entry.status));
    BindOptional(st.get(), 10, entry.actual_start_second);
    BindOptional(st.get(), 11, entry.actual_end_second);
    BindOptional(st.get(), 12, entry.actual_output);
    BindU64(st.get(), 13, entry.completed_at_ms);

    auto result = Translate(db, st.Step());
    if (!result) return result;
    entry.id = static_cast<std::uint64_t>(sqlite3_last_insert_rowid(db));

    int position = 0;
    for (const auto& assignment : entry.assignments) {
      Statement ast(db, "INSERT INTO entry_assignments(entry_id,position,worker_id,planned_output) VALUES(?,?,?,?);");
      if (!ast.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
      BindU64(ast.get(), 1, entry.id);
      BindI32(ast.get(), 2, position++);
      BindU64(ast.get(), 3, assignment.worker_id);
      BindI64(ast.get(), 4, assignment.planned_output);
      auto assignment_result = Translate(db, ast.Step());
      if (!assignment_result) return assignment_result;
    }
  }

  std::sort(schedule.entries.begin(), schedule.entries.end(), [](const model::ScheduleEntry& a, const model::ScheduleEntry& b) {
    return std::tie(a.date, a.start_second, a.id) < std::tie(b.date, b.start_second, b.id);
  });
  return Result::Ok();
}

std::optional<model::Schedule> SqliteRepository::GetSchedule(Transaction& t, std::uint64_t schedule_id) {
  return LoadSchedule(TX(t).Handle(), "SELECT id,order_id,start_date,generated_at_ms FROM schedules WHERE id=?;", schedule_id);
}

std::optional<model::Schedule> SqliteRepository::GetScheduleForOrder(Transaction& t, std::uint64_t order_id) {
  return LoadSchedule(TX(t).Handle(), "SELECT id,order_id,start_date,generated_at_ms FROM schedules WHERE order_id=?;", order_id);
}

std::vector<model::ScheduleEntry> SqliteRepository::ListEntries(Transaction& t) {
  const std::string sql = std::string("SELECT ") + kEntryColumns + " FROM schedule_entries e ORDER BY e.date,e.start_second,e.id;";
  return QueryEntries(TX(t).Handle(), sql.c_str(), 0, 0, 0);
}

std::optional<model::ScheduleEntry> SqliteRepository::GetEntry(Transaction& t, std::uint64_t entry_id) {
  const std::string sql     = std::string("SELECT ") + kEntryColumns + " FROM schedule_entries e WHERE e.id=?;";
  auto              entries = QueryEntries(TX(t).Handle(), sql.c_str(), entry_id, 0, 1);
  if (entries.empty()) return std::nullopt;
  return entries.front();
}

Result SqliteRepository::UpdateEntryProgress(Transaction& t, const model::ScheduleEntry& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "UPDATE schedule_entries SET status=?,actual_start_second=?,actual_end_second=?,actual_output=?,completed_at_ms=? "
               "WHERE id=?;");
  if (!st.ok()) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st.get(), 1, static_cast<int>(r.status));
  BindOptional(st.get(), 2, r.actual_start_second);
  BindOptional(st.get(), 3, r.actual_end_second);
  BindOptional(st.get(), 4, r.actual_output);
  BindU64(st.get(), 5, r.completed_at_ms);
  BindU64(st.get(), 6, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "entry " + std::to_string(r.id));
  return result;
}

std::vector<model::ScheduleEntry> SqliteRepository::ListCompletedEntries(Transaction& t, std::uint64_t worker_id, std::uint64_t step_id) {
  const std::string sql = std::string("SELECT ") + kEntryColumns +
                          " FROM schedule_entries e WHERE e.step_id=? AND e.status=" +
                          std::to_string(static_cast<int>(model::EntryStatus::kCompleted)) +
                          " AND EXISTS (SELECT 1 FROM entry_assignments a WHERE a.entry_id=e.id AND a.worker_id=?)"
                          " ORDER BY e.completed_at_ms DESC, e.id DESC;";
  return QueryEntries(TX(t).Handle(), sql.c_str(), step_id, worker_id, 2);
}

} // namespace shopfloor::db::sqlite
