#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/model/equipment.hpp"
#include "internal/model/order.hpp"
#include "internal/model/schedule.hpp"
#include "internal/model/step.hpp"
#include "internal/model/worker.hpp"

namespace shopfloor::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - ReplaceSchedule swaps an order's schedule in one step: readers see the
    old or the new schedule, never a mix
  - Proficiency history is append-only

  Master data (orders, steps, workers, equipment, certifications) is owned
  by the surrounding application; the Insert* calls exist for it and for
  tests. Inserts with id 0 get a generated id written back.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Consistent read snapshot; write calls through it fail.
  virtual std::unique_ptr<Transaction> BeginRead() = 0;

  // ---------------------------------------------------------------------
  // Orders and product steps
  // ---------------------------------------------------------------------

  virtual Result InsertOrder(Transaction&, model::Order&) = 0;

  virtual std::optional<model::Order> GetOrder(Transaction&, std::uint64_t order_id) = 0;

  virtual std::vector<model::Order> ListOrders(Transaction&) = 0;

  virtual Result UpdateOrderStatus(Transaction&, std::uint64_t order_id, model::OrderStatus status) = 0;

  virtual Result InsertStep(Transaction&, model::Step&) = 0;

  virtual std::optional<model::Step> GetStep(Transaction&, std::uint64_t step_id) = 0;

  // Steps of one product, ordered by sequence then id.
  virtual std::vector<model::Step> ListSteps(Transaction&, std::uint64_t product_id) = 0;

  // ---------------------------------------------------------------------
  // Workforce and equipment
  // ---------------------------------------------------------------------

  virtual Result InsertWorker(Transaction&, model::Worker&) = 0;

  virtual Result UpdateWorker(Transaction&, const model::Worker&) = 0;

  virtual std::optional<model::Worker> GetWorker(Transaction&, std::uint64_t worker_id) = 0;

  virtual std::vector<model::Worker> ListWorkers(Transaction&) = 0;

  virtual Result InsertEquipment(Transaction&, model::Equipment&) = 0;

  virtual std::vector<model::Equipment> ListEquipment(Transaction&) = 0;

  virtual Result InsertCertification(Transaction&, const model::Certification&) = 0;

  virtual std::vector<model::Certification> ListCertifications(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Proficiency
  // ---------------------------------------------------------------------

  virtual std::optional<model::Proficiency> GetProficiency(Transaction&, std::uint64_t worker_id, std::uint64_t step_id) = 0;

  virtual std::vector<model::Proficiency> ListProficiencies(Transaction&) = 0;

  virtual Result UpsertProficiency(Transaction&, const model::Proficiency&) = 0;

  virtual Result AppendProficiencyHistory(Transaction&, model::ProficiencyHistory&) = 0;

  // Oldest first.
  virtual std::vector<model::ProficiencyHistory> ListProficiencyHistory(Transaction&, std::uint64_t worker_id) = 0;

  // ---------------------------------------------------------------------
  // Schedules
  // ---------------------------------------------------------------------

  // Drops the order's current schedule and all of its entries, then stores
  // `schedule` with a fresh schedule id. Entries carrying a non-zero id keep
  // it; the others get generated ids. Ids are written back into `schedule`.
  virtual Result ReplaceSchedule(Transaction&, model::Schedule& schedule) = 0;

  virtual std::optional<model::Schedule> GetSchedule(Transaction&, std::uint64_t schedule_id) = 0;

  virtual std::optional<model::Schedule> GetScheduleForOrder(Transaction&, std::uint64_t order_id) = 0;

  // Entries of every current schedule, ordered by date, start, id.
  virtual std::vector<model::ScheduleEntry> ListEntries(Transaction&) = 0;

  virtual std::optional<model::ScheduleEntry> GetEntry(Transaction&, std::uint64_t entry_id) = 0;

  // Updates status and actuals of an existing entry.
  virtual Result UpdateEntryProgress(Transaction&, const model::ScheduleEntry&) = 0;

  // Completed entries assigned to the worker for the step, newest completion first.
  virtual std::vector<model::ScheduleEntry> ListCompletedEntries(Transaction&, std::uint64_t worker_id, std::uint64_t step_id) = 0;
};

} // namespace shopfloor::db
