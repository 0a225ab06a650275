#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace shopfloor::db::memory {

namespace {

bool EntryBefore(const model::ScheduleEntry& a, const model::ScheduleEntry& b) {
  return std::tie(a.date, a.start_second, a.id) < std::tie(b.date, b.start_second, b.id);
}

template <typename Map>
std::vector<typename Map::mapped_type> Values(const Map& map) {
  std::vector<typename Map::mapped_type> out;
  out.reserve(map.size());
  for (const auto& [_, value] : map) out.push_back(value);
  return out;
}

// Assigns a generated id when `id` is 0, otherwise keeps the counter ahead of it.
void ClaimId(std::uint64_t& id, std::uint64_t& next) {
  if (id == 0) {
    id = next++;
  } else {
    next = std::max(next, id + 1);
  }
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this, MemoryTransaction::Mode::kReadWrite);
}

std::unique_ptr<db::Transaction> MemoryRepository::BeginRead() {
  return std::make_unique<MemoryTransaction>(*this, MemoryTransaction::Mode::kReadOnly);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Orders and steps
// ------------------------------------------------------------------

Result MemoryRepository::InsertOrder(Transaction& t, model::Order& r) {
  auto& s = TX(t).Mutable();
  if (r.id != 0 && s.orders.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "order exists");
  ClaimId(r.id, s.next_order_id);
  s.orders[r.id] = r;
  return Result::Ok();
}

std::optional<model::Order> MemoryRepository::GetOrder(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.orders.find(id);
  if (it == s.orders.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Order> MemoryRepository::ListOrders(Transaction& t) {
  return Values(TX(t).View().orders);
}

Result MemoryRepository::UpdateOrderStatus(Transaction& t, std::uint64_t id, model::OrderStatus status) {
  auto& s  = TX(t).Mutable();
  auto  it = s.orders.find(id);
  if (it == s.orders.end()) return Result::Err(ErrorCode::NotFound, "order " + std::to_string(id));
  it->second.status = status;
  return Result::Ok();
}

Result MemoryRepository::InsertStep(Transaction& t, model::Step& r) {
  auto& s = TX(t).Mutable();
  if (r.id != 0 && s.steps.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "step exists");
  ClaimId(r.id, s.next_step_id);
  s.steps[r.id] = r;
  return Result::Ok();
}

std::optional<model::Step> MemoryRepository::GetStep(Transaction& t, std::uint64_t step_id) {
  const auto& s  = TX(t).View();
  auto        it = s.steps.find(step_id);
  if (it == s.steps.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Step> MemoryRepository::ListSteps(Transaction& t, std::uint64_t product_id) {
  std::vector<model::Step> out;
  for (const auto& [_, step] : TX(t).View().steps) {
    if (step.product_id == product_id) out.push_back(step);
  }
  std::sort(out.begin(), out.end(), [](const model::Step& a, const model::Step& b) {
    return std::tie(a.sequence, a.id) < std::tie(b.sequence, b.id);
  });
  return out;
}

// ------------------------------------------------------------------
// Workforce and equipment
// ------------------------------------------------------------------

Result MemoryRepository::InsertWorker(Transaction& t, model::Worker& r) {
  auto& s = TX(t).Mutable();
  if (r.id != 0 && s.workers.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "worker exists");
  ClaimId(r.id, s.next_worker_id);
  s.workers[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::UpdateWorker(Transaction& t, const model::Worker& r) {
  auto& s = TX(t).Mutable();
  if (!s.workers.contains(r.id)) return Result::Err(ErrorCode::NotFound, "worker " + std::to_string(r.id));
  s.workers[r.id] = r;
  return Result::Ok();
}

std::optional<model::Worker> MemoryRepository::GetWorker(Transaction& t, std::uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.workers.find(id);
  if (it == s.workers.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Worker> MemoryRepository::ListWorkers(Transaction& t) {
  return Values(TX(t).View().workers);
}

Result MemoryRepository::InsertEquipment(Transaction& t, model::Equipment& r) {
  auto& s = TX(t).Mutable();
  if (r.id != 0 && s.equipment.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "equipment exists");
  ClaimId(r.id, s.next_equipment_id);
  s.equipment[r.id] = r;
  return Result::Ok();
}

std::vector<model::Equipment> MemoryRepository::ListEquipment(Transaction& t) {
  return Values(TX(t).View().equipment);
}

Result MemoryRepository::InsertCertification(Transaction& t, const model::Certification& r) {
  auto& s = TX(t).Mutable();
  if (!s.workers.contains(r.worker_id) || !s.equipment.contains(r.equipment_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "certification references unknown worker or equipment");
  }
  s.certifications.push_back(r);
  return Result::Ok();
}

std::vector<model::Certification> MemoryRepository::ListCertifications(Transaction& t) {
  return TX(t).View().certifications;
}

// ------------------------------------------------------------------
// Proficiency
// ------------------------------------------------------------------

std::optional<model::Proficiency> MemoryRepository::GetProficiency(Transaction& t, std::uint64_t worker_id, std::uint64_t step_id) {
  const auto& s  = TX(t).View();
  auto        it = s.proficiencies.find({worker_id, step_id});
  if (it == s.proficiencies.end()) return std::nullopt;
  return it->second;
}

std::vector<model::Proficiency> MemoryRepository::ListProficiencies(Transaction& t) {
  return Values(TX(t).View().proficiencies);
}

Result MemoryRepository::UpsertProficiency(Transaction& t, const model::Proficiency& r) {
  auto& s = TX(t).Mutable();
  if (!s.workers.contains(r.worker_id)) return Result::Err(ErrorCode::NotFound, "worker " + std::to_string(r.worker_id));
  s.proficiencies[{r.worker_id, r.step_id}] = r;
  return Result::Ok();
}

Result MemoryRepository::AppendProficiencyHistory(Transaction& t, model::ProficiencyHistory& r) {
  auto& s = TX(t).Mutable();
  r.id    = s.next_history_id++;
  s.proficiency_history.push_back(r);
  return Result::Ok();
}

std::vector<model::ProficiencyHistory> MemoryRepository::ListProficiencyHistory(Transaction& t, std::uint64_t worker_id) {
  std::vector<model::ProficiencyHistory> out;
  for (const auto& record : TX(t).View().proficiency_history) {
    if (record.worker_id == worker_id) out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

std::optional<model::Schedule> MemoryRepository::Assemble(const State& s, std::uint64_t schedule_id) {
  auto it = s.schedules.find(schedule_id);
  if (it == s.schedules.end()) return std::nullopt;

  model::Schedule schedule = it->second;
  for (const auto& [_, entry] : s.entries) {
    if (entry.schedule_id == schedule_id) schedule.entries.push_back(entry);
  }
  std::sort(schedule.entries.begin(), schedule.entries.end(), EntryBefore);
  return schedule;
}

Result MemoryRepository::ReplaceSchedule(Transaction& t, model::Schedule& schedule) {
  auto& s = TX(t).Mutable();
  if (!s.orders.contains(schedule.order_id)) {
    return Result::Err(ErrorCode::NotFound, "order " + std::to_string(schedule.order_id));
  }

  if (auto old = s.schedule_by_order.find(schedule.order_id); old != s.schedule_by_order.end()) {
    std::erase_if(s.entries, [&](const auto& item) { return item.second.schedule_id == old->second; });
    s.schedules.erase(old->second);
    s.schedule_by_order.erase(old);
  }

  schedule.id = s.next_schedule_id++;
  for (auto& entry : schedule.entries) {
    ClaimId(entry.id, s.next_entry_id);
    if (s.entries.contains(entry.id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "entry id " + std::to_string(entry.id) + " belongs to another schedule");
    }
    entry.schedule_id   = schedule.id;
    entry.order_id      = schedule.order_id;
    s.entries[entry.id] = entry;
  }

  model::Schedule header = schedule;
  header.entries.clear();
  s.schedules[schedule.id]                = std::move(header);
  s.schedule_by_order[schedule.order_id] = schedule.id;
  std::sort(schedule.entries.begin(), schedule.entries.end(), EntryBefore);
  return Result::Ok();
}

std::optional<model::Schedule> MemoryRepository::GetSchedule(Transaction& t, std::uint64_t schedule_id) {
  return Assemble(TX(t).View(), schedule_id);
}

std::optional<model::Schedule> MemoryRepository::GetScheduleForOrder(Transaction& t, std::uint64_t order_id) {
  const auto& s  = TX(t).View();
  auto        it = s.schedule_by_order.find(order_id);
  if (it == s.schedule_by_order.end()) return std::nullopt;
  return Assemble(s, it->second);
}

std::vector<model::ScheduleEntry> MemoryRepository::ListEntries(Transaction& t) {
  auto out = Values(TX(t).View().entries);
  std::sort(out.begin(), out.end(), EntryBefore);
  return out;
}

std::optional<model::ScheduleEntry> MemoryRepository::GetEntry(Transaction& t, std::uint64_t entry_id) {
  const auto& s  = TX(t).View();
  auto        it = s.entries.find(entry_id);
  if (it == s.entries.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateEntryProgress(Transaction& t, const model::ScheduleEntry& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(r.id);
  if (it == s.entries.end()) return Result::Err(ErrorCode::NotFound, "entry " + std::to_string(r.id));

  auto& stored               = it->second;
  stored.status              = r.status;
  stored.actual_start_second = r.actual_start_second;
  stored.actual_end_second   = r.actual_end_second;
  stored.actual_output       = r.actual_output;
  stored.completed_at_ms     = r.completed_at_ms;
  return Result::Ok();
}

std::vector<model::ScheduleEntry> MemoryRepository::ListCompletedEntries(Transaction& t, std::uint64_t worker_id, std::uint64_t step_id) {
  std::vector<model::ScheduleEntry> out;
  for (const auto& [_, entry] : TX(t).View().entries) {
    if (entry.step_id == step_id && entry.status == model::EntryStatus::kCompleted && entry.HasWorker(worker_id)) {
      out.push_back(entry);
    }
  }
  std::sort(out.begin(), out.end(), [](const model::ScheduleEntry& a, const model::ScheduleEntry& b) {
    return std::tie(a.completed_at_ms, a.id) > std::tie(b.completed_at_ms, b.id);
  });
  return out;
}

} // namespace shopfloor::db::memory
