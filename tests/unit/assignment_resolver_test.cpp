#include "internal/scheduling/assignment_resolver.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using shopfloor::catalog::ResourceSnapshot;
using shopfloor::model::Certification;
using shopfloor::model::SkillCategory;
using shopfloor::model::Step;
using shopfloor::model::WarningKind;
using shopfloor::model::WorkerStatus;
using shopfloor::scheduling::AssignmentResolver;
using shopfloor::scheduling::BookingLedger;
using shopfloor::scheduling::SchedulingOptions;
using shopfloor::util::ParseDate;
using shopfloor::util::ParseTimeOfDay;

constexpr std::uint64_t kStep = 11;

ResourceSnapshot Floor() {
  ResourceSnapshot snapshot;
  snapshot.workers.push_back({1, "sewer", WorkerStatus::kActive, SkillCategory::kSewing});
  snapshot.workers.push_back({2, "cutter-a", WorkerStatus::kActive, SkillCategory::kOther});
  snapshot.workers.push_back({3, "cutter-b", WorkerStatus::kInactive, SkillCategory::kOther});
  snapshot.workers.push_back({4, "cutter-c", WorkerStatus::kActive, SkillCategory::kOther});
  snapshot.proficiency[{4, kStep}] = 5;
  return snapshot;
}

Step CuttingStep() {
  Step step;
  step.id                     = kStep;
  step.product_id             = 1;
  step.name                   = "cut";
  step.required_skill         = SkillCategory::kOther;
  step.time_per_piece_seconds = 10;
  return step;
}

void TestEligibilityFiltersStatusAndSkill() {
  auto               snapshot = Floor();
  AssignmentResolver resolver(snapshot, SchedulingOptions{});

  const auto monday = ParseDate("2026-03-02");
  assert((resolver.EligibleWorkers(CuttingStep(), monday) == std::vector<std::uint64_t>{2, 4}));

  SchedulingOptions  covering{.sewing_workers_cover_other = true};
  AssignmentResolver widened(snapshot, covering);
  assert((widened.EligibleWorkers(CuttingStep(), monday) == std::vector<std::uint64_t>{1, 2, 4}));

  AssignmentResolver excluding(snapshot, SchedulingOptions{}, {4});
  assert((excluding.EligibleWorkers(CuttingStep(), monday) == std::vector<std::uint64_t>{2}));
}

void TestCertificationRequiredForEquipment() {
  auto snapshot = Floor();
  snapshot.certifications.push_back(Certification{2, 9, ParseDate("2026-03-01")});
  snapshot.certifications.push_back(Certification{4, 9, std::nullopt});

  auto step         = CuttingStep();
  step.equipment_id = 9;

  AssignmentResolver resolver(snapshot, SchedulingOptions{});
  assert((resolver.EligibleWorkers(step, ParseDate("2026-03-02")) == std::vector<std::uint64_t>{4}));
  assert((resolver.EligibleWorkers(step, ParseDate("2026-02-27")) == std::vector<std::uint64_t>{2, 4}));
}

void TestEquipmentWarning() {
  auto snapshot = Floor();
  auto step     = CuttingStep();

  AssignmentResolver resolver(snapshot, SchedulingOptions{});
  assert(!resolver.EquipmentWarning(1, step));

  step.equipment_id = 77;
  auto warning      = resolver.EquipmentWarning(1, step);
  assert(warning);
  assert(warning->kind == WarningKind::kEquipmentUnavailable);
  assert(warning->step_id == kStep);
}

void TestEstimateAndCrewFactor() {
  auto               snapshot = Floor();
  AssignmentResolver resolver(snapshot, SchedulingOptions{});

  const auto crew = resolver.EstimateCrew(CuttingStep(), ParseDate("2026-03-02"));
  assert((crew == std::vector<std::uint64_t>{4}));
  assert(std::abs(resolver.CrewFactor(CuttingStep(), crew) - 0.7) < 1e-12);
  assert(resolver.CrewFactor(CuttingStep(), {}) == 1.0);
  assert(std::abs(resolver.CrewFactor(CuttingStep(), {2, 2}) - 0.5) < 1e-12);
}

void TestApportionSumsExactly() {
  auto               snapshot = Floor();
  AssignmentResolver resolver(snapshot, SchedulingOptions{});

  auto shares = resolver.Apportion(CuttingStep(), {2, 4}, 10);
  assert(shares.size() == 2);
  assert(shares[0].worker_id == 2 && shares[0].planned_output == 3);
  assert(shares[1].worker_id == 4 && shares[1].planned_output == 7);

  for (std::int64_t output : {0, 1, 7, 997}) {
    std::int64_t total = 0;
    for (const auto& a : resolver.Apportion(CuttingStep(), {2, 4}, output)) total += a.planned_output;
    assert(total == output);
  }
  assert(resolver.Apportion(CuttingStep(), {}, 10).empty());
}

void TestResolvePrefersFreeWorkers() {
  auto               snapshot = Floor();
  AssignmentResolver resolver(snapshot, SchedulingOptions{});

  const auto    monday = ParseDate("2026-03-02");
  BookingLedger ledger({{4, 99, monday, ParseTimeOfDay("07:00"), ParseTimeOfDay("12:00")}});

  auto slot = resolver.Resolve(1, CuttingStep(), {monday, ParseTimeOfDay("08:00"), ParseTimeOfDay("09:00")}, 40, ledger);
  assert(!slot.unassigned());
  assert(slot.assignments.size() == 1);
  assert(slot.assignments[0].worker_id == 2);
  assert(slot.assignments[0].planned_output == 40);
  assert(slot.warnings.empty());
  assert(ledger.Overlaps(2, monday, ParseTimeOfDay("08:30"), ParseTimeOfDay("08:45")));
  assert(ledger.BookedSeconds(2, monday) == 3600);
}

void TestResolveLeavesSlotOpenWhenEveryoneIsBusy() {
  ResourceSnapshot snapshot;
  snapshot.workers.push_back({2, "cutter", WorkerStatus::kActive, SkillCategory::kOther});
  AssignmentResolver resolver(snapshot, SchedulingOptions{});

  const auto    monday = ParseDate("2026-03-02");
  BookingLedger ledger({{2, 99, monday, ParseTimeOfDay("07:00"), ParseTimeOfDay("12:00")}});

  auto slot = resolver.Resolve(1, CuttingStep(), {monday, ParseTimeOfDay("08:00"), ParseTimeOfDay("09:00")}, 40, ledger);
  assert(slot.unassigned());
  assert(slot.warnings.size() == 1);
  assert(slot.warnings[0].kind == WarningKind::kWorkersBusy);
  assert(ledger.BookedSeconds(2, monday) == 5 * 3600);

  // Touching the end of a booking is not an overlap.
  auto after = resolver.Resolve(1, CuttingStep(), {monday, ParseTimeOfDay("12:00"), ParseTimeOfDay("13:00")}, 40, ledger);
  assert(after.assignments.size() == 1);
  assert(after.assignments[0].worker_id == 2);
  assert(after.warnings.empty());
}

void TestFreeStretch() {
  const auto    monday = ParseDate("2026-03-02");
  const auto    h      = [](const char* text) { return ParseTimeOfDay(text); };
  BookingLedger ledger({{2, 99, monday, h("07:00"), h("09:00")},
                        {2, 99, monday, h("11:00"), h("12:00")},
                        {4, 98, monday, h("07:00"), h("10:00")}});

  auto whole = ledger.FreeStretch({}, monday, h("07:00"), h("15:30"));
  assert(whole && whole->start_second == h("07:00") && whole->end_second == h("15:30"));

  // Worker 2 frees up first and stays free until its 11:00 booking.
  auto first = ledger.FreeStretch({2, 4}, monday, h("07:00"), h("15:30"));
  assert(first);
  assert(first->start_second == h("09:00"));
  assert(first->end_second == h("11:00"));

  // From 10:00 worker 4 is free for the rest of the range.
  auto later = ledger.FreeStretch({2, 4}, monday, h("10:00"), h("15:30"));
  assert(later && later->start_second == h("10:00") && later->end_second == h("15:30"));

  assert(!ledger.FreeStretch({2}, monday, h("07:30"), h("08:30")));
  assert(!ledger.FreeStretch({2}, monday, h("09:00"), h("09:00")));

  auto tuesday = ledger.FreeStretch({2}, ParseDate("2026-03-03"), h("07:00"), h("08:00"));
  assert(tuesday && tuesday->start_second == h("07:00") && tuesday->end_second == h("08:00"));
}

void TestResolveWithoutEligibleWorkers() {
  auto               snapshot = Floor();
  AssignmentResolver resolver(snapshot, SchedulingOptions{});

  auto step           = CuttingStep();
  step.required_skill = SkillCategory::kSewing;
  snapshot.workers.erase(snapshot.workers.begin());

  BookingLedger ledger;
  auto          slot = resolver.Resolve(1, step, {ParseDate("2026-03-02"), 0, 3600}, 10, ledger);
  assert(slot.unassigned());
  assert(slot.crew_factor == 1.0);
}

void TestCaptureTakesActiveWorkersAndOtherOrdersBookings() {
  using shopfloor::db::ThrowIfDbError;

  shopfloor::db::memory::MemoryRepository repository;
  const auto                              monday = ParseDate("2026-03-02");

  std::vector<std::uint64_t> orders;
  {
    auto tx = repository.Begin();
    shopfloor::model::Worker active{0, "active", WorkerStatus::kActive, SkillCategory::kOther};
    shopfloor::model::Worker idle{0, "idle", WorkerStatus::kInactive, SkillCategory::kOther};
    ThrowIfDbError(repository.InsertWorker(*tx, idle), "insert worker");
    ThrowIfDbError(repository.InsertWorker(*tx, active), "insert worker");

    auto step = CuttingStep();
    step.id   = 0;
    ThrowIfDbError(repository.InsertStep(*tx, step), "insert step");

    for (int i = 0; i < 2; ++i) {
      shopfloor::model::Order order{0, 1, 10, monday, shopfloor::model::OrderStatus::kScheduled};
      ThrowIfDbError(repository.InsertOrder(*tx, order), "insert order");

      shopfloor::model::Schedule schedule;
      schedule.order_id   = order.id;
      schedule.start_date = monday;
      shopfloor::model::ScheduleEntry entry;
      entry.step_id        = step.id;
      entry.date           = monday;
      entry.start_second   = ParseTimeOfDay("07:00") + i * 3600;
      entry.end_second     = ParseTimeOfDay("08:00") + i * 3600;
      entry.planned_output = 10;
      entry.assignments    = {{active.id, 10}};
      schedule.entries.push_back(entry);
      ThrowIfDbError(repository.ReplaceSchedule(*tx, schedule), "replace schedule");
      orders.push_back(order.id);
    }
    tx->Commit();
  }

  auto                                           tx = repository.BeginRead();
  shopfloor::catalog::RepositoryResourceSource   source(repository, *tx);
  const auto snapshot = shopfloor::catalog::ResourceCatalog::Capture(source, orders[0], 42);
  tx->Rollback();

  assert(snapshot.taken_at_ms == 42);
  assert(snapshot.workers.size() == 1);
  assert(snapshot.workers[0].name == "active");
  assert(snapshot.bookings.size() == 1);
  assert(snapshot.bookings[0].order_id == orders[1]);
  assert(snapshot.bookings[0].start_second == ParseTimeOfDay("08:00"));
}

} // namespace

int main() {
  TestEligibilityFiltersStatusAndSkill();
  TestCertificationRequiredForEquipment();
  TestEquipmentWarning();
  TestEstimateAndCrewFactor();
  TestApportionSumsExactly();
  TestResolvePrefersFreeWorkers();
  TestResolveLeavesSlotOpenWhenEveryoneIsBusy();
  TestFreeStretch();
  TestResolveWithoutEligibleWorkers();
  TestCaptureTakesActiveWorkersAndOtherOrdersBookings();

  std::cout << "shopfloor_unit_assignment_resolver: pass\n";
  return 0;
}
