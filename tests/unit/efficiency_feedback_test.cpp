#include "internal/feedback/efficiency_feedback.hpp"

#include <cassert>
#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using shopfloor::calendar::ShiftPattern;
using shopfloor::calendar::StandardShiftCalendar;
using shopfloor::db::ThrowIfDbError;
using shopfloor::db::memory::MemoryRepository;
using shopfloor::feedback::EfficiencyFeedback;
using shopfloor::feedback::FeedbackOptions;
using shopfloor::model::EntryStatus;
using shopfloor::model::Order;
using shopfloor::model::OrderStatus;
using shopfloor::model::ProficiencyReason;
using shopfloor::model::Schedule;
using shopfloor::model::ScheduleEntry;
using shopfloor::model::SkillCategory;
using shopfloor::model::Step;
using shopfloor::model::Worker;
using shopfloor::model::WorkerStatus;
using shopfloor::util::ParseDate;
using shopfloor::util::ParseTimeOfDay;
using shopfloor::util::ValidationError;
using shopfloor::util::ValidationErrorKind;

const auto kMonday = ParseDate("2026-03-02");

bool Near(double a, double b) {
  return std::abs(a - b) < 1e-6;
}

void ExpectValidation(ValidationErrorKind kind, const std::function<void()>& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const ValidationError& e) {
    threw = e.kind() == kind;
  }
  assert(threw);
}

void ExpectNotFound(const std::function<void()>& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const shopfloor::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

// One worker on a 60 s/pc step, one hour (60 pieces) planned on each of six working days.
struct Line {
  Line();

  std::shared_ptr<MemoryRepository>      repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<StandardShiftCalendar> calendar   = std::make_shared<StandardShiftCalendar>();
  EfficiencyFeedback                     feedback{repository, calendar, FeedbackOptions{}, nullptr,
                                  [] { return shopfloor::util::TimePoint{ParseDate("2026-03-09")} + std::chrono::hours(18); }};

  std::uint64_t              order_id  = 0;
  std::uint64_t              step_id   = 0;
  std::uint64_t              worker_id = 0;
  std::vector<std::uint64_t> entries;
};

Line::Line() {
  auto tx = repository->Begin();

  Step step;
  step.product_id             = 1;
  step.name                   = "hem";
  step.sequence               = 1;
  step.required_skill         = SkillCategory::kOther;
  step.time_per_piece_seconds = 60;
  ThrowIfDbError(repository->InsertStep(*tx, step), "insert step");

  Worker worker{0, "operator", WorkerStatus::kActive, SkillCategory::kOther};
  ThrowIfDbError(repository->InsertWorker(*tx, worker), "insert worker");

  Order order{0, 1, 360, kMonday + std::chrono::days{14}, OrderStatus::kScheduled};
  ThrowIfDbError(repository->InsertOrder(*tx, order), "insert order");

  Schedule schedule;
  schedule.order_id   = order.id;
  schedule.start_date = kMonday;
  for (int day : {0, 1, 2, 3, 4, 7}) {
    ScheduleEntry entry;
    entry.step_id        = step.id;
    entry.date           = kMonday + std::chrono::days{day};
    entry.start_second   = ParseTimeOfDay("07:00");
    entry.end_second     = ParseTimeOfDay("08:00");
    entry.planned_output = 60;
    entry.assignments    = {{worker.id, 60}};
    schedule.entries.push_back(entry);
  }
  ThrowIfDbError(repository->ReplaceSchedule(*tx, schedule), "replace schedule");
  tx->Commit();

  order_id  = order.id;
  step_id   = step.id;
  worker_id = worker.id;
  for (const auto& entry : schedule.entries) entries.push_back(entry.id);
}

OrderStatus StatusOf(Line& line) {
  auto tx    = line.repository->Begin();
  auto order = line.repository->GetOrder(*tx, line.order_id);
  tx->Rollback();
  return order->status;
}

void TestLifecycleTransitions() {
  using shopfloor::model::EntryStatus;
  using shopfloor::model::OrderStatus;

  static_assert(shopfloor::model::CanTransition(EntryStatus::kNotStarted, EntryStatus::kCompleted));
  static_assert(!shopfloor::model::CanTransition(EntryStatus::kInProgress, EntryStatus::kInProgress));
  static_assert(!shopfloor::model::CanTransition(EntryStatus::kCompleted, EntryStatus::kInProgress));

  assert(shopfloor::model::CanTransition(OrderStatus::kScheduled, OrderStatus::kCompleted));
  assert(!shopfloor::model::CanTransition(OrderStatus::kInProgress, OrderStatus::kPending));
  assert(!shopfloor::model::CanTransition(OrderStatus::kCompleted, OrderStatus::kInProgress));
  assert(shopfloor::model::StatusAfterProgress(false) == OrderStatus::kInProgress);
  assert(!shopfloor::model::IsOpen(OrderStatus::kCompleted));
}

void TestActualWorkingSeconds() {
  ShiftPattern pattern;
  pattern.overtime_end = ParseTimeOfDay("18:00");
  StandardShiftCalendar calendar(pattern);

  ScheduleEntry entry;
  entry.date                = kMonday;
  entry.start_second        = ParseTimeOfDay("10:00");
  entry.end_second          = ParseTimeOfDay("12:00");
  assert(!shopfloor::feedback::ActualWorkingSeconds(calendar, entry));

  entry.actual_end_second = ParseTimeOfDay("12:00");
  assert(*shopfloor::feedback::ActualWorkingSeconds(calendar, entry) == 90 * 60);

  // Overtime past the shift end counts in full.
  entry.actual_end_second = ParseTimeOfDay("16:30");
  assert(*shopfloor::feedback::ActualWorkingSeconds(calendar, entry) == 5 * 3600 + 3600);

  entry.date              = kMonday + std::chrono::days{5};
  entry.actual_end_second = ParseTimeOfDay("11:00");
  assert(*shopfloor::feedback::ActualWorkingSeconds(calendar, entry) == 3600);

  entry.actual_end_second = ParseTimeOfDay("09:00");
  assert(*shopfloor::feedback::ActualWorkingSeconds(calendar, entry) == 0);
}

void TestActualSharesFollowPlannedSplit() {
  ScheduleEntry entry;
  entry.assignments   = {{1, 3}, {2, 7}};
  entry.actual_output = 5;
  auto shares         = shopfloor::feedback::ActualShares(entry);
  assert(shares.size() == 2);
  assert(shares[0] == 1 && shares[1] == 4);

  entry.assignments   = {{1, 0}, {2, 0}};
  entry.actual_output = 9;
  shares              = shopfloor::feedback::ActualShares(entry);
  assert(shares[0] + shares[1] == 9);
}

void TestEfficiencyArithmetic() {
  StandardShiftCalendar calendar;

  ScheduleEntry entry;
  entry.date                = kMonday;
  entry.start_second        = ParseTimeOfDay("07:00");
  entry.end_second          = ParseTimeOfDay("08:00");
  entry.assignments         = {{1, 30}, {2, 30}};
  entry.actual_start_second = ParseTimeOfDay("07:00");
  entry.actual_end_second   = ParseTimeOfDay("08:00");
  entry.actual_output       = 90;

  assert(!shopfloor::feedback::WorkerEfficiency(calendar, entry, 1, 60));

  entry.status = EntryStatus::kCompleted;
  assert(Near(*shopfloor::feedback::WorkerEfficiency(calendar, entry, 1, 60), 75.0));
  assert(!shopfloor::feedback::WorkerEfficiency(calendar, entry, 3, 60));
  assert(!shopfloor::feedback::WorkerEfficiency(calendar, entry, 1, 0));
  assert(Near(*shopfloor::feedback::EntryEfficiency(calendar, entry, 60), 75.0));
}

void TestRecordStartMovesOrderInProgress() {
  Line line;

  auto started = line.feedback.RecordStart(line.entries[0]);
  assert(started.status == EntryStatus::kInProgress);
  assert(started.actual_start_second == ParseTimeOfDay("07:00"));
  assert(StatusOf(line) == OrderStatus::kInProgress);

  ExpectValidation(ValidationErrorKind::kInvalidActuals, [&] { line.feedback.RecordStart(line.entries[0]); });
  ExpectValidation(ValidationErrorKind::kInvalidActuals, [&] { line.feedback.RecordStart(line.entries[1], -5); });
  ExpectNotFound([&] { line.feedback.RecordStart(9999); });

  auto late = line.feedback.RecordStart(line.entries[1], ParseTimeOfDay("07:30"));
  assert(late.actual_start_second == ParseTimeOfDay("07:30"));
}

void TestInvalidCompletionsAreRejected() {
  Line line;

  ExpectValidation(ValidationErrorKind::kInvalidActuals, [&] { line.feedback.RecordCompletion(line.entries[0], -1, ParseTimeOfDay("08:00")); });
  ExpectValidation(ValidationErrorKind::kInvalidActuals, [&] { line.feedback.RecordCompletion(line.entries[0], 10, ParseTimeOfDay("06:00")); });
  ExpectValidation(ValidationErrorKind::kInvalidActuals, [&] { line.feedback.RecordCompletion(line.entries[0], 10, 90000); });

  line.feedback.RecordCompletion(line.entries[0], 60, ParseTimeOfDay("08:00"));
  ExpectValidation(ValidationErrorKind::kInvalidActuals, [&] { line.feedback.RecordCompletion(line.entries[0], 60, ParseTimeOfDay("08:00")); });
  ExpectNotFound([&] { line.feedback.RecordCompletion(9999, 1, ParseTimeOfDay("08:00")); });
}

void TestSlowCompletionsLowerProficiency() {
  Line line;

  // Half the standard rate: 30 pieces in the planned hour.
  for (std::size_t i = 0; i < 4; ++i) {
    auto result = line.feedback.RecordCompletion(line.entries[i], 30, ParseTimeOfDay("08:00"));
    assert(result.entry.status == EntryStatus::kCompleted);
    assert(result.proficiency_changes.empty());
    assert(result.assignments.size() == 1);
    assert(Near(*result.assignments[0].efficiency_percent, 50.0));
    assert(Near(result.assignments[0].expected_minutes, 30.0));
    assert(Near(result.assignments[0].actual_minutes, 60.0));
  }
  assert(StatusOf(line) == OrderStatus::kInProgress);

  auto fifth = line.feedback.RecordCompletion(line.entries[4], 30, ParseTimeOfDay("08:00"));
  assert(fifth.proficiency_changes.size() == 1);
  const auto& change = fifth.proficiency_changes[0];
  assert(change.worker_id == line.worker_id);
  assert(change.step_id == line.step_id);
  assert(change.old_level == 3);
  assert(change.new_level == 2);
  assert(change.reason == ProficiencyReason::kAutoDecrease);
  assert(change.sample_size == 5);
  assert(Near(*change.average_efficiency, 50.0));

  // Samples before the change no longer count.
  auto last = line.feedback.RecordCompletion(line.entries[5], 30, ParseTimeOfDay("08:00"));
  assert(last.proficiency_changes.empty());
  assert(StatusOf(line) == OrderStatus::kCompleted);

  auto tx      = line.repository->Begin();
  auto level   = line.repository->GetProficiency(*tx, line.worker_id, line.step_id);
  auto history = line.repository->ListProficiencyHistory(*tx, line.worker_id);
  tx->Rollback();
  assert(level && level->level == 2);
  assert(history.size() == 1);
  assert(history[0].reason == ProficiencyReason::kAutoDecrease);
}

void TestFastCompletionsRaiseProficiency() {
  Line line;
  for (std::size_t i = 0; i < 4; ++i) line.feedback.RecordCompletion(line.entries[i], 90, ParseTimeOfDay("08:00"));

  auto fifth = line.feedback.RecordCompletion(line.entries[4], 90, ParseTimeOfDay("08:00"));
  assert(fifth.proficiency_changes.size() == 1);
  assert(fifth.proficiency_changes[0].new_level == 4);
  assert(fifth.proficiency_changes[0].reason == ProficiencyReason::kAutoIncrease);
}

void TestSetProficiency() {
  Line line;

  ExpectValidation(ValidationErrorKind::kInvalidArgument, [&] { line.feedback.SetProficiency(line.worker_id, line.step_id, 0); });
  ExpectValidation(ValidationErrorKind::kInvalidArgument, [&] { line.feedback.SetProficiency(line.worker_id, line.step_id, 6); });
  ExpectNotFound([&] { line.feedback.SetProficiency(9999, line.step_id, 4); });
  ExpectNotFound([&] { line.feedback.SetProficiency(line.worker_id, 9999, 4); });

  assert(!line.feedback.SetProficiency(line.worker_id, line.step_id, 3));

  auto change = line.feedback.SetProficiency(line.worker_id, line.step_id, 5);
  assert(change);
  assert(change->old_level == 3 && change->new_level == 5);
  assert(change->reason == ProficiencyReason::kManual);
  assert(!change->average_efficiency);

  assert(!line.feedback.SetProficiency(line.worker_id, line.step_id, 5));
}

void TestProductivityAndAnalytics() {
  Line line;
  line.feedback.RecordCompletion(line.entries[0], 60, ParseTimeOfDay("08:00"));
  line.feedback.RecordCompletion(line.entries[1], 30, ParseTimeOfDay("08:00"));

  auto productivity = line.feedback.GetWorkerProductivity(line.worker_id);
  assert(productivity.name == "operator");
  assert(productivity.completed_entries == 2);
  assert(productivity.total_units == 90);
  assert(Near(productivity.total_hours, 2.0));
  assert(Near(*productivity.average_efficiency, 75.0));
  assert(productivity.steps.size() == 1);
  assert(productivity.steps[0].step_name == "hem");
  assert(productivity.steps[0].proficiency_level == 3);

  auto planned = line.feedback.GetAssignmentAnalytics(line.entries[2]);
  assert(planned.size() == 1);
  assert(planned[0].actual_output == 0);
  assert(Near(planned[0].expected_minutes, 60.0));
  assert(!planned[0].efficiency_percent);

  auto done = line.feedback.GetAssignmentAnalytics(line.entries[0]);
  assert(Near(*done[0].efficiency_percent, 100.0));

  ExpectNotFound([&] { line.feedback.GetWorkerProductivity(9999); });
  ExpectNotFound([&] { line.feedback.GetAssignmentAnalytics(9999); });
}

void TestConcurrentCompletionsCrossALevelOnce() {
  Line line;

  // All six slow completions land together; the pair lock lets exactly one
  // evaluation see the full window and step the level down.
  std::vector<shopfloor::feedback::CompletionResult> results(line.entries.size());
  std::vector<std::thread>                           threads;
  for (std::size_t i = 0; i < line.entries.size(); ++i) {
    threads.emplace_back([&, i] { results[i] = line.feedback.RecordCompletion(line.entries[i], 30, ParseTimeOfDay("08:00")); });
  }
  for (auto& t : threads) t.join();

  std::size_t changes = 0;
  for (const auto& result : results) {
    assert(result.entry.status == EntryStatus::kCompleted);
    changes += result.proficiency_changes.size();
  }
  assert(changes == 1);
  assert(StatusOf(line) == OrderStatus::kCompleted);

  auto history = line.feedback.GetProficiencyHistory(line.worker_id, line.step_id);
  assert(history.size() == 1);
  assert(history[0].old_level == 3 && history[0].new_level == 2);

  auto tx    = line.repository->Begin();
  auto level = line.repository->GetProficiency(*tx, line.worker_id, line.step_id);
  tx->Rollback();
  assert(level && level->level == 2);
}

void TestProficiencyHistoryFiltersByStep() {
  Line line;

  std::uint64_t other_step = 0;
  {
    auto tx = line.repository->Begin();
    Step press;
    press.product_id             = 1;
    press.name                   = "press";
    press.sequence               = 2;
    press.required_skill         = SkillCategory::kOther;
    press.time_per_piece_seconds = 30;
    ThrowIfDbError(line.repository->InsertStep(*tx, press), "insert step");
    tx->Commit();
    other_step = press.id;
  }

  line.feedback.SetProficiency(line.worker_id, line.step_id, 4);
  line.feedback.SetProficiency(line.worker_id, other_step, 1);
  line.feedback.SetProficiency(line.worker_id, line.step_id, 5);

  auto all = line.feedback.GetProficiencyHistory(line.worker_id);
  assert(all.size() == 3);
  assert(all[0].step_id == line.step_id && all[0].new_level == 4);
  assert(all[1].step_id == other_step && all[1].new_level == 1);
  assert(all[2].old_level == 4 && all[2].new_level == 5);

  auto hem = line.feedback.GetProficiencyHistory(line.worker_id, line.step_id);
  assert(hem.size() == 2);
  for (const auto& record : hem) assert(record.step_id == line.step_id && record.reason == ProficiencyReason::kManual);

  assert(line.feedback.GetProficiencyHistory(line.worker_id, other_step).size() == 1);
  ExpectNotFound([&] { line.feedback.GetProficiencyHistory(9999); });
  ExpectNotFound([&] { line.feedback.GetProficiencyHistory(line.worker_id, 9999); });
}

} // namespace

int main() {
  TestLifecycleTransitions();
  TestActualWorkingSeconds();
  TestActualSharesFollowPlannedSplit();
  TestEfficiencyArithmetic();
  TestRecordStartMovesOrderInProgress();
  TestInvalidCompletionsAreRejected();
  TestSlowCompletionsLowerProficiency();
  TestFastCompletionsRaiseProficiency();
  TestSetProficiency();
  TestProductivityAndAnalytics();
  TestConcurrentCompletionsCrossALevelOnce();
  TestProficiencyHistoryFiltersByStep();

  std::cout << "shopfloor_unit_efficiency_feedback: pass\n";
  return 0;
}
