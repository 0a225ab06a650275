#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/calendar/shift_calendar.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/schedule.hpp"
#include "internal/model/worker.hpp"
#include "internal/scheduling/order_locks.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::feedback {

struct FeedbackOptions {
  std::uint32_t window_size                = 10;
  std::uint32_t min_samples                = 5;
  double        increase_threshold_percent = 120.0;
  double        decrease_threshold_percent = 80.0;
  std::uint32_t lookback_days              = 30;
};

// ------------------------------------------------------------------
// Efficiency arithmetic shared with the capacity analysis
// ------------------------------------------------------------------

// Seconds worked in the logged window: breaks excluded, time past the
// shift end counted in full. Empty until the entry has an end.
std::optional<std::int32_t> ActualWorkingSeconds(const calendar::ShiftCalendar& calendar, const model::ScheduleEntry& entry);

// Actual output split across the crew in proportion to the planned shares.
std::vector<std::int64_t> ActualShares(const model::ScheduleEntry& entry);

// expected / actual x 100 for one assigned worker of a completed entry.
std::optional<double> WorkerEfficiency(const calendar::ShiftCalendar& calendar, const model::ScheduleEntry& entry, std::uint64_t worker_id,
                                       std::int64_t time_per_piece_seconds);

// Whole-entry efficiency, labor time = crew size x working window.
std::optional<double> EntryEfficiency(const calendar::ShiftCalendar& calendar, const model::ScheduleEntry& entry,
                                      std::int64_t time_per_piece_seconds);

struct AssignmentAnalytics {
  std::uint64_t         worker_id      = 0;
  std::int64_t          planned_output = 0;
  std::int64_t          actual_output  = 0;
  double                expected_minutes = 0.0;
  double                actual_minutes   = 0.0;
  std::optional<double> efficiency_percent;
};

struct CompletionResult {
  model::ScheduleEntry                   entry;
  std::vector<model::ProficiencyHistory> proficiency_changes;
  std::vector<AssignmentAnalytics>       assignments;
};

struct StepProductivity {
  std::uint64_t         step_id = 0;
  std::string           step_name;
  std::int32_t          completed_entries = 0;
  std::int64_t          units             = 0;
  double                hours             = 0.0;
  std::optional<double> average_efficiency;
  std::int32_t          proficiency_level = model::kDefaultProficiency;
};

struct WorkerProductivity {
  std::uint64_t                 worker_id = 0;
  std::string                   name;
  std::int32_t                  completed_entries = 0;
  std::int64_t                  total_units       = 0;
  double                        total_hours       = 0.0;
  std::optional<double>         average_efficiency;
  std::vector<StepProductivity> steps;
};

/*
  Closes the loop from logged actuals back into proficiency.

  Completions lock the entry's order (waiting behind a running
  generation) for the entry write, then evaluate each assigned worker
  under a per (worker, step) mutex. Proficiency history is append-only.
*/
class EfficiencyFeedback {
 public:
  using NowFn = std::function<util::TimePoint()>;

  EfficiencyFeedback(std::shared_ptr<db::Repository> repository, std::shared_ptr<const calendar::ShiftCalendar> calendar, FeedbackOptions options,
                     std::shared_ptr<scheduling::OrderLocks> order_locks, NowFn now = util::Now);

  model::ScheduleEntry RecordStart(std::uint64_t entry_id, std::optional<std::int32_t> actual_start_second = std::nullopt);

  CompletionResult RecordCompletion(std::uint64_t entry_id, std::int64_t actual_output, std::int32_t actual_end_second);

  // Manual edit; empty when the level is unchanged.
  std::optional<model::ProficiencyHistory> SetProficiency(std::uint64_t worker_id, std::uint64_t step_id, std::int32_t level);

  WorkerProductivity GetWorkerProductivity(std::uint64_t worker_id);

  // Level changes of a worker in recording order, optionally for one step.
  std::vector<model::ProficiencyHistory> GetProficiencyHistory(std::uint64_t worker_id, std::optional<std::uint64_t> step_id = std::nullopt);

  std::vector<AssignmentAnalytics> GetAssignmentAnalytics(std::uint64_t entry_id);

  const FeedbackOptions& options() const {
    return options_;
  }

 private:
  // Re-evaluates the trailing window of one pair; returns the change if any.
  std::optional<model::ProficiencyHistory> EvaluateWorker(std::uint64_t worker_id, std::uint64_t step_id, std::int64_t time_per_piece_seconds);

  std::vector<AssignmentAnalytics> Analyze(const model::ScheduleEntry& entry, std::int64_t time_per_piece_seconds) const;

  // Step definition of an entry, resolved through its order's product.
  model::Step StepOf(db::Transaction& tx, const model::ScheduleEntry& entry);

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<const calendar::ShiftCalendar> calendar_;
  FeedbackOptions                                options_;
  std::shared_ptr<scheduling::OrderLocks>        order_locks_;
  NowFn                                          now_;

  scheduling::KeyedMutexTable<std::pair<std::uint64_t, std::uint64_t>> pair_locks_;
};

} // namespace shopfloor::feedback
