#include "slot_allocator.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include "internal/model/order.hpp"
#include "internal/util/errors.hpp"

namespace shopfloor::scheduling {

namespace {

constexpr double kFactorTolerance = 1e-9;

struct ResolvedPlan {
  std::vector<PlannedSlot>  slots;
  std::vector<ResolvedSlot> crews;
  BookingLedger             ledger;
  double                    factor = 1.0;
};

// Output-weighted crew factor; slots without output count once each.
double WeightedFactor(const std::vector<PlannedSlot>& slots, const std::vector<ResolvedSlot>& crews) {
  double       weighted     = 0.0;
  std::int64_t total_output = 0;
  for (std::size_t i = 0; i < slots.size(); ++i) {
    weighted += crews[i].crew_factor * static_cast<double>(slots[i].planned_output);
    total_output += slots[i].planned_output;
  }
  if (total_output > 0) return weighted / static_cast<double>(total_output);

  double sum = 0.0;
  for (const auto& crew : crews) sum += crew.crew_factor;
  return crews.empty() ? 1.0 : sum / static_cast<double>(crews.size());
}

// quantity * consumed / total without overflowing int64.
std::int64_t CumulativeOutput(std::int64_t quantity, std::int64_t consumed, std::int64_t total) {
  return static_cast<std::int64_t>(static_cast<__int128>(quantity) * consumed / total);
}

} // namespace

std::vector<PlannedSlot> SlotAllocator::Split(std::int64_t quantity, std::int64_t time_per_piece_seconds, calendar::SlotTime earliest,
                                              double crew_factor, const util::Deadline& deadline, const FreeStretchFn& free_stretch) const {
  std::vector<PlannedSlot> slots;
  if (quantity <= 0) return slots;
  if (quantity > model::kMaxOrderQuantity) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidQuantity,
                                "quantity " + std::to_string(quantity) + " exceeds " + std::to_string(model::kMaxOrderQuantity));
  }

  if (time_per_piece_seconds == 0) {
    const auto open = calendar_.NextOpenSlot(earliest);
    slots.push_back({open.date, open.second, open.second, quantity});
    return slots;
  }

  const auto total = static_cast<std::int64_t>(
      std::ceil(static_cast<double>(quantity) * static_cast<double>(time_per_piece_seconds) * crew_factor - kFactorTolerance));

  std::int64_t consumed = 0;
  std::int64_t produced = 0;
  auto         cursor   = earliest;
  while (consumed < total) {
    deadline.Check("slot allocation");

    auto open  = calendar_.NextOpenSlot(cursor);
    auto limit = calendar_.DayEnd(open.date);
    if (free_stretch) {
      const auto stretch = free_stretch(open.date, open.second, limit);
      if (!stretch) {
        cursor = {open.date, limit};
        continue;
      }
      if (stretch->start_second > open.second) {
        const auto shifted = calendar_.NextOpenSlot({stretch->date, stretch->start_second});
        if (shifted.date != stretch->date || shifted.second >= stretch->end_second) {
          cursor = {stretch->date, stretch->end_second};
          continue;
        }
        open = shifted;
      }
      limit = stretch->end_second;
    }

    const auto available = calendar_.WorkingSecondsBetween(open.date, open.second, limit);
    if (available <= 0) {
      cursor = {open.date, limit};
      continue;
    }
    const auto take = std::min<std::int64_t>(total - consumed, available);
    const auto end  = calendar_.Advance(open.date, open.second, take);

    consumed += take;
    const std::int64_t cumulative = consumed == total ? quantity : CumulativeOutput(quantity, consumed, total);
    slots.push_back({open.date, open.second, end, cumulative - produced});
    produced = cumulative;
    cursor   = {open.date, end};
  }
  return slots;
}

AllocationResult SlotAllocator::Allocate(const graph::StepGraph& graph, const AllocationRequest& request, BookingLedger& ledger) const {
  AllocationResult                                result;
  std::map<model::StepCategory, calendar::SlotTime> category_cursor;

  for (auto step_id : graph.Order()) {
    request.deadline.Check("step allocation");
    const auto& step = graph.Step(step_id);

    auto earliest = request.start;
    if (auto it = category_cursor.find(step.category); it != category_cursor.end()) earliest = std::max(earliest, it->second);
    for (auto dependency : graph.Dependencies(step_id)) {
      if (auto it = result.completions.find(dependency); it != result.completions.end()) earliest = std::max(earliest, it->second);
    }

    std::optional<calendar::SlotTime> fixed;
    if (auto it = request.fixed_completions.find(step_id); it != request.fixed_completions.end()) {
      fixed    = it->second;
      earliest = std::max(earliest, *fixed);
    }

    const auto quantity_it = request.quantities.find(step_id);
    const auto quantity    = quantity_it == request.quantities.end() ? 0 : quantity_it->second;
    if (quantity <= 0) {
      if (fixed) {
        result.completions[step_id]    = *fixed;
        category_cursor[step.category] = earliest;
      }
      continue;
    }

    if (auto warning = resolver_.EquipmentWarning(request.order_id, step)) result.warnings.push_back(*warning);

    auto resolve = [&](double factor) {
      ResolvedPlan plan;
      const auto free_stretch = [&](util::Date date, std::int32_t from, std::int32_t until) {
        return ledger.FreeStretch(resolver_.EligibleWorkers(step, date), date, from, until);
      };
      plan.slots  = Split(quantity, step.time_per_piece_seconds, earliest, factor, request.deadline, free_stretch);
      plan.ledger = ledger;
      for (const auto& slot : plan.slots) {
        plan.crews.push_back(resolver_.Resolve(request.order_id, step, {slot.date, slot.start_second, slot.end_second}, slot.planned_output,
                                               plan.ledger));
      }
      plan.factor = WeightedFactor(plan.slots, plan.crews);
      return plan;
    };

    // Crew size drives duration and duration drives crews; settle in at most two passes.
    const auto estimate = resolver_.CrewFactor(step, resolver_.EstimateCrew(step, earliest.date));
    auto       plan     = resolve(estimate);
    if (std::abs(plan.factor - estimate) > kFactorTolerance) plan = resolve(plan.factor);
    ledger = std::move(plan.ledger);

    bool unassigned = false;
    for (std::size_t i = 0; i < plan.slots.size(); ++i) {
      const auto&          slot = plan.slots[i];
      model::ScheduleEntry entry;
      entry.order_id       = request.order_id;
      entry.step_id        = step_id;
      entry.date           = slot.date;
      entry.start_second   = slot.start_second;
      entry.end_second     = slot.end_second;
      entry.planned_output = slot.planned_output;
      entry.assignments    = std::move(plan.crews[i].assignments);
      unassigned           = unassigned || entry.assignments.empty();
      result.entries.push_back(std::move(entry));

      for (auto& warning : plan.crews[i].warnings) result.warnings.push_back(std::move(warning));
    }

    if (unassigned) {
      result.warnings.push_back({model::WarningKind::kResourceUnavailable, request.order_id, step_id, plan.slots.front().date,
                                 "no eligible worker for step '" + step.name + "'"});
    }

    calendar::SlotTime completion{plan.slots.back().date, plan.slots.back().end_second};
    if (fixed) completion = std::max(completion, *fixed);
    result.completions[step_id]    = completion;
    category_cursor[step.category] = completion;
  }
  return result;
}

} // namespace shopfloor::scheduling
