#pragma once

#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace shopfloor::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::uint64_t, model::Order> orders;
    std::map<std::uint64_t, model::Step> steps;
    std::map<std::uint64_t, model::Worker> workers;
    std::map<std::uint64_t, model::Equipment> equipment;
    std::vector<model::Certification> certifications;
    std::map<std::pair<std::uint64_t, std::uint64_t>, model::Proficiency> proficiencies;
    std::vector<model::ProficiencyHistory> proficiency_history;

    // schedules are stored without entries; entries are keyed by id
    std::map<std::uint64_t, model::Schedule> schedules;
    std::map<std::uint64_t, std::uint64_t> schedule_by_order;
    std::map<std::uint64_t, model::ScheduleEntry> entries;

    std::uint64_t next_order_id = 1;
    std::uint64_t next_step_id = 1;
    std::uint64_t next_worker_id = 1;
    std::uint64_t next_equipment_id = 1;
    std::uint64_t next_history_id = 1;
    std::uint64_t next_schedule_id = 1;
    std::uint64_t next_entry_id = 1;
  };

  static std::optional<model::Schedule> Assemble(const State& s, std::uint64_t schedule_id);

  std::mutex mutex_;
  State committed_;
  std::uint64_t committed_version_ = 0;
};

}
