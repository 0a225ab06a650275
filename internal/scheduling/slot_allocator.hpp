#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "internal/calendar/shift_calendar.hpp"
#include "internal/graph/step_graph.hpp"
#include "internal/model/schedule.hpp"
#include "internal/scheduling/assignment_resolver.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::scheduling {

// One shift-bounded piece of a step's duration.
struct PlannedSlot {
  util::Date   date{};
  std::int32_t start_second   = 0;
  std::int32_t end_second     = 0;
  std::int64_t planned_output = 0;
};

struct AllocationRequest {
  std::uint64_t order_id = 0;

  // Quantity to plan per step; steps absent or at 0 get no new entries.
  std::map<std::uint64_t, std::int64_t> quantities;

  calendar::SlotTime start;

  // Completion of work already fixed for a step (preserved entries).
  std::map<std::uint64_t, calendar::SlotTime> fixed_completions;

  util::Deadline deadline;
};

struct AllocationResult {
  std::vector<model::ScheduleEntry>           entries;
  std::map<std::uint64_t, calendar::SlotTime> completions;
  std::vector<model::ScheduleWarning>         warnings;
};

/*
  Turns a step graph and quantities into dated entries.

  Steps are walked in topological order. A step starts at the latest of the
  order start, the cursor of its category line and the completion of its
  dependencies. Its duration is cut at shift ends and breaks; planned output
  follows cumulative elapsed time so that a step's entries sum to its
  quantity.

  A slot only opens while an eligible worker is free in the run's ledger and
  ends where that worker's next booking starts. Steps with no eligible
  worker at all are placed by the calendar alone and left unassigned.
*/
class SlotAllocator {
 public:
  // Earliest stretch of [from, until) on a date during which a crew is free.
  using FreeStretchFn = std::function<std::optional<SlotWindow>(util::Date, std::int32_t, std::int32_t)>;

  SlotAllocator(const calendar::ShiftCalendar& calendar, const AssignmentResolver& resolver) : calendar_(calendar), resolver_(resolver) {
  }

  // Throws ValidationError(kInvalidQuantity) above model::kMaxOrderQuantity.
  std::vector<PlannedSlot> Split(std::int64_t quantity, std::int64_t time_per_piece_seconds, calendar::SlotTime earliest, double crew_factor,
                                 const util::Deadline& deadline = {}, const FreeStretchFn& free_stretch = {}) const;

  AllocationResult Allocate(const graph::StepGraph& graph, const AllocationRequest& request, BookingLedger& ledger) const;

 private:
  const calendar::ShiftCalendar& calendar_;
  const AssignmentResolver&      resolver_;
};

} // namespace shopfloor::scheduling
