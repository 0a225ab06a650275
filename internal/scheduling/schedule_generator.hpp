#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "internal/calendar/shift_calendar.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/schedule.hpp"
#include "internal/scheduling/order_locks.hpp"
#include "internal/scheduling/scheduling_options.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::scheduling {

// Evening block proposed to pull a late order back to its due date.
struct OvertimeSuggestion {
  util::Date                   date{};
  std::int32_t                 start_second   = 0;
  std::int32_t                 end_second     = 0;
  std::uint64_t                step_id        = 0;
  std::int64_t                 planned_output = 0;
  std::optional<std::uint64_t> worker_id;
};

/*
  Whether the planned work fits before the due date.

  completed_output counts pieces through every step. Hours cover only the
  entries planned by this call. When the last planned day is past the due
  date, overtime blocks are proposed on working days from the start up to
  the due date until the late working time plus a two hour buffer is
  covered.
*/
struct Feasibility {
  bool                            can_meet_deadline     = true;
  std::int64_t                    completed_output      = 0;
  std::int64_t                    remaining_output      = 0;
  double                          regular_hours_needed  = 0.0;
  double                          overtime_hours_needed = 0.0;
  std::vector<OvertimeSuggestion> overtime_suggestions;
};

struct GenerationResult {
  model::Schedule                     schedule;
  std::vector<model::ScheduleWarning> warnings;
  Feasibility                         feasibility;
};

struct ReplanConstraints {
  // Regenerate from scratch instead of keeping started and completed entries.
  bool                         discard_actuals = false;
  std::set<std::uint64_t>      excluded_workers;
  std::optional<std::uint32_t> max_crew_size;
};

/*
  Orchestrates schedule generation and replanning for one order.

  CRITICAL GUARANTEES:

  - One generation per order at a time; a concurrent request fails with
    ConcurrencyConflict instead of waiting
  - All planning happens on a resource snapshot taken once per call
  - Nothing is written when validation fails or the deadline passes
  - The new schedule replaces the old one in a single transaction
*/
class ScheduleGenerator {
 public:
  using NowFn = std::function<util::TimePoint()>;

  ScheduleGenerator(std::shared_ptr<db::Repository> repository, std::shared_ptr<const calendar::ShiftCalendar> calendar,
                    SchedulingOptions options, std::shared_ptr<OrderLocks> order_locks, NowFn now = util::Now);

  GenerationResult Generate(std::uint64_t order_id, std::optional<calendar::SlotTime> start = std::nullopt,
                            std::optional<util::Deadline> deadline = std::nullopt);

  GenerationResult Replan(std::uint64_t schedule_id, std::optional<calendar::SlotTime> start = std::nullopt, const ReplanConstraints& constraints = {},
                          std::optional<util::Deadline> deadline = std::nullopt);

  model::Schedule GetSchedule(std::uint64_t schedule_id);

  const SchedulingOptions& options() const {
    return options_;
  }

 private:
  util::Deadline     ResolveDeadline(const std::optional<util::Deadline>& deadline) const;
  calendar::SlotTime ResolveStart(const std::optional<calendar::SlotTime>& start) const;

  // Writes the schedule, retrying backend write conflicts.
  void Commit(model::Schedule& schedule);

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<const calendar::ShiftCalendar> calendar_;
  SchedulingOptions                              options_;
  std::shared_ptr<OrderLocks>                    order_locks_;
  NowFn                                          now_;
};

} // namespace shopfloor::scheduling
