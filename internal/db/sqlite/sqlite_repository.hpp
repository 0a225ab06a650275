#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace shopfloor::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::unique_ptr<Transaction> BeginRead() override;

  Result InsertOrder(Transaction&, model::Order&) override;
  std::optional<model::Order> GetOrder(Transaction&, std::uint64_t) override;
  std::vector<model::Order> ListOrders(Transaction&) override;
  Result UpdateOrderStatus(Transaction&, std::uint64_t, model::OrderStatus) override;

  Result InsertStep(Transaction&, model::Step&) override;
  std::optional<model::Step> GetStep(Transaction&, std::uint64_t step_id) override;
  std::vector<model::Step> ListSteps(Transaction&, std::uint64_t product_id) override;

  Result InsertWorker(Transaction&, model::Worker&) override;
  Result UpdateWorker(Transaction&, const model::Worker&) override;
  std::optional<model::Worker> GetWorker(Transaction&, std::uint64_t) override;
  std::vector<model::Worker> ListWorkers(Transaction&) override;

  Result InsertEquipment(Transaction&, model::Equipment&) override;
  std::vector<model::Equipment> ListEquipment(Transaction&) override;
  Result InsertCertification(Transaction&, const model::Certification&) override;
  std::vector<model::Certification> ListCertifications(Transaction&) override;

  std::optional<model::Proficiency> GetProficiency(Transaction&, std::uint64_t worker_id, std::uint64_t step_id) override;
  std::vector<model::Proficiency> ListProficiencies(Transaction&) override;
  Result UpsertProficiency(Transaction&, const model::Proficiency&) override;
  Result AppendProficiencyHistory(Transaction&, model::ProficiencyHistory&) override;
  std::vector<model::ProficiencyHistory> ListProficiencyHistory(Transaction&, std::uint64_t worker_id) override;

  Result ReplaceSchedule(Transaction&, model::Schedule&) override;
  std::optional<model::Schedule> GetSchedule(Transaction&, std::uint64_t) override;
  std::optional<model::Schedule> GetScheduleForOrder(Transaction&, std::uint64_t) override;
  std::vector<model::ScheduleEntry> ListEntries(Transaction&) override;
  std::optional<model::ScheduleEntry> GetEntry(Transaction&, std::uint64_t) override;
  Result UpdateEntryProgress(Transaction&, const model::ScheduleEntry&) override;
  std::vector<model::ScheduleEntry> ListCompletedEntries(Transaction&, std::uint64_t worker_id, std::uint64_t step_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::vector<model::ScheduleEntry> QueryEntries(sqlite3* db, const char* sql, std::uint64_t a, std::uint64_t b, int bind_count);
  Result LoadAssignments(sqlite3* db, model::ScheduleEntry& entry);
  std::optional<model::Schedule> LoadSchedule(sqlite3* db, const char* header_sql, std::uint64_t key);
};

}
