#include "internal/scheduling/schedule_generator.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <thread>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using shopfloor::calendar::SlotTime;
using shopfloor::calendar::StandardShiftCalendar;
using shopfloor::db::ThrowIfDbError;
using shopfloor::db::memory::MemoryRepository;
using shopfloor::model::EntryStatus;
using shopfloor::model::Order;
using shopfloor::model::OrderStatus;
using shopfloor::model::Schedule;
using shopfloor::model::SkillCategory;
using shopfloor::model::Step;
using shopfloor::model::StepCategory;
using shopfloor::model::WarningKind;
using shopfloor::model::Worker;
using shopfloor::model::WorkerStatus;
using shopfloor::scheduling::OrderLocks;
using shopfloor::scheduling::ReplanConstraints;
using shopfloor::scheduling::ScheduleGenerator;
using shopfloor::scheduling::SchedulingOptions;
using shopfloor::util::ParseDate;
using shopfloor::util::ParseTimeOfDay;

const auto kMonday = ParseDate("2026-03-02");

struct Plant {
  std::shared_ptr<MemoryRepository>      repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<StandardShiftCalendar> calendar   = std::make_shared<StandardShiftCalendar>();
  std::shared_ptr<OrderLocks>            locks      = std::make_shared<OrderLocks>();
  ScheduleGenerator                      generator{repository, calendar, SchedulingOptions{}, locks,
                          [] { return shopfloor::util::TimePoint{kMonday} + std::chrono::hours(6); }};

  std::uint64_t order_id = 0;
  std::uint64_t cut_id   = 0;
  std::uint64_t sew_id   = 0;
};

// Cutting (10 s, OTHER) then sewing (20 s, SEWING), 100 pieces due Saturday.
Plant MakePlant(int sewing_workers = 1) {
  Plant plant;
  auto  tx = plant.repository->Begin();

  Step cut;
  cut.product_id             = 1;
  cut.name                   = "cut panels";
  cut.sequence               = 1;
  cut.category               = StepCategory::kCutting;
  cut.required_skill         = SkillCategory::kOther;
  cut.time_per_piece_seconds = 10;
  ThrowIfDbError(plant.repository->InsertStep(*tx, cut), "insert step");

  Step sew;
  sew.product_id             = 1;
  sew.name                   = "sew seams";
  sew.sequence               = 2;
  sew.category               = StepCategory::kSewing;
  sew.required_skill         = SkillCategory::kSewing;
  sew.time_per_piece_seconds = 20;
  sew.dependencies           = {cut.id};
  ThrowIfDbError(plant.repository->InsertStep(*tx, sew), "insert step");

  Worker cutter{0, "cutter", WorkerStatus::kActive, SkillCategory::kOther};
  ThrowIfDbError(plant.repository->InsertWorker(*tx, cutter), "insert worker");
  for (int i = 0; i < sewing_workers; ++i) {
    Worker sewer{0, "sewer-" + std::to_string(i), WorkerStatus::kActive, SkillCategory::kSewing};
    ThrowIfDbError(plant.repository->InsertWorker(*tx, sewer), "insert worker");
  }

  Order order{0, 1, 100, kMonday + std::chrono::days{5}, OrderStatus::kPending};
  ThrowIfDbError(plant.repository->InsertOrder(*tx, order), "insert order");
  tx->Commit();

  plant.order_id = order.id;
  plant.cut_id   = cut.id;
  plant.sew_id   = sew.id;
  return plant;
}

std::map<std::uint64_t, std::int64_t> OutputByStep(const Schedule& schedule) {
  std::map<std::uint64_t, std::int64_t> out;
  for (const auto& entry : schedule.entries) out[entry.step_id] += entry.planned_output;
  return out;
}

OrderStatus StatusOf(Plant& plant) {
  auto tx    = plant.repository->Begin();
  auto order = plant.repository->GetOrder(*tx, plant.order_id);
  tx->Rollback();
  assert(order);
  return order->status;
}

void TestDependentStepsFollowEachOther() {
  auto plant  = MakePlant();
  auto result = plant.generator.Generate(plant.order_id, SlotTime{kMonday, ParseTimeOfDay("07:00")});

  assert(result.warnings.empty());
  assert(result.schedule.id != 0);
  assert(result.schedule.start_date == kMonday);
  assert(result.schedule.entries.size() == 2);

  const auto& cut = result.schedule.entries[0];
  const auto& sew = result.schedule.entries[1];
  assert(cut.step_id == plant.cut_id);
  assert(sew.step_id == plant.sew_id);
  assert(cut.start_second == ParseTimeOfDay("07:00"));
  assert(cut.end_second <= sew.start_second);
  assert(cut.assignments.size() == 1 && sew.assignments.size() == 1);

  const auto totals = OutputByStep(result.schedule);
  assert(totals.at(plant.cut_id) == 100);
  assert(totals.at(plant.sew_id) == 100);

  assert(StatusOf(plant) == OrderStatus::kScheduled);

  const auto stored = plant.generator.GetSchedule(result.schedule.id);
  assert(stored.entries.size() == 2);
  assert(stored.entries[0].id == cut.id);
}

void TestStartDefaultsToNextOpenSlotAfterNow() {
  auto plant  = MakePlant();
  auto result = plant.generator.Generate(plant.order_id);
  // "now" is 06:00 Monday; the shift opens at 07:00.
  assert(result.schedule.entries.front().date == kMonday);
  assert(result.schedule.entries.front().start_second == ParseTimeOfDay("07:00"));
}

void TestDefaultStartFollowsPlantClock() {
  auto plant = MakePlant();

  shopfloor::calendar::ShiftPattern pattern;
  pattern.utc_offset_minutes = 120;
  auto local = std::make_shared<StandardShiftCalendar>(pattern);

  // 05:50 UTC is 07:50 at the plant, rounded up to the next quarter hour.
  ScheduleGenerator generator(plant.repository, local, SchedulingOptions{}, plant.locks,
                              [] { return shopfloor::util::TimePoint{kMonday} + std::chrono::hours(5) + std::chrono::minutes(50); });
  auto result = generator.Generate(plant.order_id);
  assert(result.schedule.entries.front().date == kMonday);
  assert(result.schedule.entries.front().start_second == ParseTimeOfDay("08:00"));
}

void TestMissingSkillLeavesStepUnassigned() {
  auto plant  = MakePlant(0);
  auto result = plant.generator.Generate(plant.order_id, SlotTime{kMonday, ParseTimeOfDay("07:00")});

  bool resource_warning = false;
  for (const auto& warning : result.warnings) {
    if (warning.kind == WarningKind::kResourceUnavailable && warning.step_id == plant.sew_id) resource_warning = true;
  }
  assert(resource_warning);

  for (const auto& entry : result.schedule.entries) {
    if (entry.step_id == plant.sew_id) assert(entry.assignments.empty());
    if (entry.step_id == plant.cut_id) assert(!entry.assignments.empty());
  }
  assert(OutputByStep(result.schedule).at(plant.sew_id) == 100);
}

void TestLateCompletionWarnsDueDateMissed() {
  auto plant = MakePlant();
  {
    auto tx    = plant.repository->Begin();
    auto order = plant.repository->GetOrder(*tx, plant.order_id);
    tx->Rollback();

    Order big{0, order->product_id, 20000, kMonday + std::chrono::days{1}, OrderStatus::kPending};
    auto  wtx = plant.repository->Begin();
    ThrowIfDbError(plant.repository->InsertOrder(*wtx, big), "insert order");
    wtx->Commit();
    plant.order_id = big.id;
  }

  auto result = plant.generator.Generate(plant.order_id, SlotTime{kMonday, 0});
  bool missed = false;
  for (const auto& warning : result.warnings) missed = missed || warning.kind == WarningKind::kDueDateMissed;
  assert(missed);

  // 200000 s of cutting plus 400000 s of sewing, due Tuesday: one full
  // 15:30-18:00 block offered on each day up to the due date.
  const auto& feasibility = result.feasibility;
  assert(!feasibility.can_meet_deadline);
  assert(feasibility.completed_output == 0);
  assert(feasibility.remaining_output == 20000);
  assert(std::abs(feasibility.regular_hours_needed - 600000.0 / 3600.0) < 1e-9);
  assert(feasibility.overtime_suggestions.size() == 2);
  assert(std::abs(feasibility.overtime_hours_needed - 5.0) < 1e-9);
  for (std::size_t i = 0; i < feasibility.overtime_suggestions.size(); ++i) {
    const auto& block = feasibility.overtime_suggestions[i];
    assert(block.date == kMonday + std::chrono::days{static_cast<int>(i)});
    assert(block.start_second == ParseTimeOfDay("15:30") && block.end_second == ParseTimeOfDay("18:00"));
    assert(block.step_id == plant.cut_id);
    assert(block.planned_output == 900);
    assert(block.worker_id);
  }

  for (const auto& entry : result.schedule.entries) {
    assert(entry.start_second >= ParseTimeOfDay("07:00"));
    assert(entry.end_second <= ParseTimeOfDay("15:30"));
    assert(plant.calendar->IsWorkingDay(entry.date));
  }
}

void TestConcurrentGenerationConflicts() {
  auto plant = MakePlant();

  bool threw = false;
  {
    std::lock_guard<std::mutex> held(plant.locks->For(plant.order_id));
    std::thread                 contender([&] {
      try {
        plant.generator.Generate(plant.order_id, SlotTime{kMonday, 0});
      } catch (const shopfloor::util::ConcurrencyConflict&) {
        threw = true;
      }
    });
    contender.join();
  }
  assert(threw);
  assert(StatusOf(plant) == OrderStatus::kPending);
}

void TestExpiredDeadlineKeepsPreviousSchedule() {
  auto       plant = MakePlant();
  const auto first = plant.generator.Generate(plant.order_id, SlotTime{kMonday, 0});

  const auto expired = shopfloor::util::Deadline(std::chrono::steady_clock::now() - std::chrono::seconds(1));
  bool       threw   = false;
  try {
    plant.generator.Generate(plant.order_id, SlotTime{kMonday + std::chrono::days{1}, 0}, expired);
  } catch (const shopfloor::util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);

  auto tx      = plant.repository->Begin();
  auto current = plant.repository->GetScheduleForOrder(*tx, plant.order_id);
  tx->Rollback();
  assert(current);
  assert(current->id == first.schedule.id);
  assert(current->entries.size() == first.schedule.entries.size());
}

void TestInvalidOrdersAreRejected() {
  auto plant = MakePlant();

  bool not_found = false;
  try {
    plant.generator.Generate(9999);
  } catch (const shopfloor::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  Order empty{0, 1, 0, kMonday, OrderStatus::kPending};
  Order orphan{0, 42, 10, kMonday, OrderStatus::kPending};
  {
    auto tx = plant.repository->Begin();
    ThrowIfDbError(plant.repository->InsertOrder(*tx, empty), "insert order");
    ThrowIfDbError(plant.repository->InsertOrder(*tx, orphan), "insert order");
    tx->Commit();
  }

  auto expect_validation = [&](std::uint64_t order_id, shopfloor::util::ValidationErrorKind kind) {
    bool threw = false;
    try {
      plant.generator.Generate(order_id, SlotTime{kMonday, 0});
    } catch (const shopfloor::util::ValidationError& e) {
      threw = e.kind() == kind;
    }
    assert(threw);
  };
  expect_validation(empty.id, shopfloor::util::ValidationErrorKind::kInvalidQuantity);
  expect_validation(orphan.id, shopfloor::util::ValidationErrorKind::kInvalidStep);

  bool missing_schedule = false;
  try {
    plant.generator.GetSchedule(12345);
  } catch (const shopfloor::util::NotFound&) {
    missing_schedule = true;
  }
  assert(missing_schedule);
}

void TestReplanIsDeterministic() {
  auto       plant = MakePlant();
  const auto first = plant.generator.Generate(plant.order_id, SlotTime{kMonday, 0});

  const SlotTime start{kMonday + std::chrono::days{1}, ParseTimeOfDay("09:00")};
  const auto     a = plant.generator.Replan(first.schedule.id, start);
  const auto     b = plant.generator.Replan(a.schedule.id, start);

  assert(a.schedule.id != first.schedule.id);
  assert(a.schedule.entries.size() == b.schedule.entries.size());
  for (std::size_t i = 0; i < a.schedule.entries.size(); ++i) {
    const auto& x = a.schedule.entries[i];
    const auto& y = b.schedule.entries[i];
    assert(x.step_id == y.step_id && x.date == y.date);
    assert(x.start_second == y.start_second && x.end_second == y.end_second);
    assert(x.planned_output == y.planned_output);
    assert(x.assignments.size() == y.assignments.size());
    for (std::size_t k = 0; k < x.assignments.size(); ++k) {
      assert(x.assignments[k].worker_id == y.assignments[k].worker_id);
      assert(x.assignments[k].planned_output == y.assignments[k].planned_output);
    }
  }
  assert(a.schedule.entries.front().start_second == ParseTimeOfDay("09:00"));

  bool gone = false;
  try {
    plant.generator.GetSchedule(first.schedule.id);
  } catch (const shopfloor::util::NotFound&) {
    gone = true;
  }
  assert(gone);
}

void TestReplanKeepsLoggedWork() {
  auto plant = MakePlant();
  auto first = plant.generator.Generate(plant.order_id, SlotTime{kMonday, 0});

  auto cut                = first.schedule.entries[0];
  cut.status              = EntryStatus::kCompleted;
  cut.actual_start_second = cut.start_second;
  cut.actual_end_second   = cut.end_second;
  cut.actual_output       = 100;
  {
    auto tx = plant.repository->Begin();
    ThrowIfDbError(plant.repository->UpdateEntryProgress(*tx, cut), "update entry");
    tx->Commit();
  }

  const auto replanned = plant.generator.Replan(first.schedule.id, SlotTime{kMonday + std::chrono::days{2}, 0});
  const auto totals    = OutputByStep(replanned.schedule);
  assert(totals.at(plant.cut_id) == 100);
  assert(totals.at(plant.sew_id) == 100);

  std::size_t cut_entries = 0;
  for (const auto& entry : replanned.schedule.entries) {
    if (entry.step_id != plant.cut_id) continue;
    ++cut_entries;
    assert(entry.id == cut.id);
    assert(entry.status == EntryStatus::kCompleted);
    assert(entry.date == kMonday);
  }
  assert(cut_entries == 1);

  ReplanConstraints fresh;
  fresh.discard_actuals = true;
  const auto discarded  = plant.generator.Replan(replanned.schedule.id, SlotTime{kMonday + std::chrono::days{2}, 0}, fresh);
  for (const auto& entry : discarded.schedule.entries) assert(entry.status == EntryStatus::kNotStarted);
}

void TestReplanReportsCompletedWork() {
  auto plant = MakePlant();
  auto first = plant.generator.Generate(plant.order_id, SlotTime{kMonday, 0});
  assert(first.feasibility.can_meet_deadline);
  assert(first.feasibility.remaining_output == 100);

  // Cutting done in full, sewing finished 60 pieces: 60 are through every step.
  {
    auto tx = plant.repository->Begin();
    for (auto entry : first.schedule.entries) {
      entry.status              = EntryStatus::kCompleted;
      entry.actual_start_second = entry.start_second;
      entry.actual_end_second   = entry.end_second;
      entry.actual_output       = entry.step_id == plant.cut_id ? 100 : 60;
      ThrowIfDbError(plant.repository->UpdateEntryProgress(*tx, entry), "update entry");
    }
    tx->Commit();
  }

  const auto replanned = plant.generator.Replan(first.schedule.id, SlotTime{kMonday + std::chrono::days{1}, 0});
  const auto& feasibility = replanned.feasibility;
  assert(feasibility.completed_output == 60);
  assert(feasibility.remaining_output == 40);
  assert(feasibility.can_meet_deadline);
  assert(feasibility.overtime_suggestions.empty());
  // Only the 40 missing sewn pieces are planned again.
  assert(std::abs(feasibility.regular_hours_needed - 40.0 * 20.0 / 3600.0) < 1e-9);
}

void TestExcludedWorkersAreNotAssigned() {
  auto plant = MakePlant(2);
  auto first = plant.generator.Generate(plant.order_id, SlotTime{kMonday, 0});

  std::uint64_t sewer = 0;
  for (const auto& entry : first.schedule.entries) {
    if (entry.step_id == plant.sew_id) sewer = entry.assignments.front().worker_id;
  }
  assert(sewer != 0);

  ReplanConstraints constraints;
  constraints.excluded_workers = {sewer};
  const auto replanned         = plant.generator.Replan(first.schedule.id, SlotTime{kMonday, 0}, constraints);
  for (const auto& entry : replanned.schedule.entries) assert(!entry.HasWorker(sewer));
}

void TestCrewSharesTheWork() {
  auto plant = MakePlant(3);

  SchedulingOptions options;
  options.max_crew_size = 2;
  ScheduleGenerator crews(plant.repository, plant.calendar, options, plant.locks,
                          [] { return shopfloor::util::TimePoint{kMonday} + std::chrono::hours(6); });

  const auto solo   = plant.generator.Generate(plant.order_id, SlotTime{kMonday, ParseTimeOfDay("07:00")});
  const auto shared = crews.Generate(plant.order_id, SlotTime{kMonday, ParseTimeOfDay("07:00")});
  assert(shared.warnings.empty());

  auto sewing_seconds = [&](const Schedule& schedule) {
    std::int64_t seconds = 0;
    for (const auto& entry : schedule.entries) {
      if (entry.step_id == plant.sew_id) seconds += entry.end_second - entry.start_second;
    }
    return seconds;
  };
  // Two level-3 sewers halve the 2000 s a single sewer needs.
  assert(sewing_seconds(solo.schedule) == 2000);
  assert(sewing_seconds(shared.schedule) == 1000);

  for (const auto& entry : shared.schedule.entries) {
    std::int64_t assigned = 0;
    for (const auto& assignment : entry.assignments) assigned += assignment.planned_output;
    assert(assigned == entry.planned_output);

    if (entry.step_id == plant.sew_id) {
      assert(entry.assignments.size() == 2);
      assert(entry.assignments[0].worker_id != entry.assignments[1].worker_id);
      assert(entry.assignments[0].planned_output == 50 && entry.assignments[1].planned_output == 50);
    } else {
      assert(entry.assignments.size() == 1);
    }
  }
  assert(OutputByStep(shared.schedule).at(plant.sew_id) == 100);
}

} // namespace

int main() {
  TestDependentStepsFollowEachOther();
  TestStartDefaultsToNextOpenSlotAfterNow();
  TestDefaultStartFollowsPlantClock();
  TestMissingSkillLeavesStepUnassigned();
  TestLateCompletionWarnsDueDateMissed();
  TestConcurrentGenerationConflicts();
  TestExpiredDeadlineKeepsPreviousSchedule();
  TestInvalidOrdersAreRejected();
  TestReplanIsDeterministic();
  TestReplanKeepsLoggedWork();
  TestReplanReportsCompletedWork();
  TestExcludedWorkersAreNotAssigned();
  TestCrewSharesTheWork();

  std::cout << "shopfloor_unit_schedule_generator: pass\n";
  return 0;
}
