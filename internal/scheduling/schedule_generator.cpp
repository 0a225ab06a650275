#include "schedule_generator.hpp"

#include <algorithm>
#include <chrono>
#include <map>
#include <mutex>
#include <tuple>

#include "internal/catalog/resource_catalog.hpp"
#include "internal/db/api/retry.hpp"
#include "internal/graph/step_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduling/assignment_resolver.hpp"
#include "internal/scheduling/slot_allocator.hpp"
#include "internal/util/errors.hpp"

namespace shopfloor::scheduling {

namespace {

struct PlanningInput {
  model::Order              order;
  graph::StepGraph          graph;
  catalog::ResourceSnapshot snapshot;
};

bool EntryBefore(const model::ScheduleEntry& a, const model::ScheduleEntry& b) {
  return std::tie(a.date, a.start_second, a.step_id, a.id) < std::tie(b.date, b.start_second, b.step_id, b.id);
}

std::string_view WarningKindName(model::WarningKind kind) {
  switch (kind) {
    case model::WarningKind::kResourceUnavailable:
      return "resource_unavailable";
    case model::WarningKind::kWorkersBusy:
      return "workers_busy";
    case model::WarningKind::kEquipmentUnavailable:
      return "equipment_unavailable";
    case model::WarningKind::kDueDateMissed:
      return "due_date_missed";
  }
  return "unknown";
}

void RecordWarningMetrics(const std::vector<model::ScheduleWarning>& warnings) {
  std::map<model::WarningKind, std::uint64_t> counts;
  for (const auto& warning : warnings) ++counts[warning.kind];
  for (const auto& [kind, count] : counts) {
    observability::Metrics::Instance().RecordScheduleWarnings(WarningKindName(kind), count);
  }
}

// Loads everything planning needs inside one read transaction.
PlanningInput LoadPlanningInput(db::Repository& repository, std::uint64_t order_id, const SchedulingOptions& options, std::uint64_t now_ms) {
  auto tx = repository.BeginRead();

  auto order = repository.GetOrder(*tx, order_id);
  if (!order) {
    throw util::NotFound("order " + std::to_string(order_id));
  }
  if (order->quantity <= 0 || order->quantity > model::kMaxOrderQuantity) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidQuantity, "order " + std::to_string(order_id) + " has quantity " +
                                                                                 std::to_string(order->quantity) + " (allowed 1.." +
                                                                                 std::to_string(model::kMaxOrderQuantity) + ")");
  }
  if (order->status == model::OrderStatus::kCompleted) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument, "order " + std::to_string(order_id) + " is already completed");
  }

  auto steps = repository.ListSteps(*tx, order->product_id);
  if (steps.empty()) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidStep, "product " + std::to_string(order->product_id) + " has no steps");
  }
  auto graph = graph::StepGraph::Build(order->product_id, steps, options.reject_forward_dependencies);

  catalog::RepositoryResourceSource source(repository, *tx);
  auto                              snapshot = catalog::ResourceCatalog::Capture(source, order_id, now_ms);

  tx->Rollback();
  return {*order, std::move(graph), std::move(snapshot)};
}

void AddDueDateWarning(const model::Order& order, const AllocationResult& allocation, std::vector<model::ScheduleWarning>& warnings) {
  std::optional<calendar::SlotTime> finish;
  for (const auto& [_, completion] : allocation.completions) {
    if (!finish || *finish < completion) finish = completion;
  }
  if (finish && finish->date > order.due_date) {
    warnings.push_back({model::WarningKind::kDueDateMissed, order.id, 0, finish->date,
                        "planned completion " + util::FormatDate(finish->date) + " is after due date " + util::FormatDate(order.due_date)});
  }
}

constexpr std::int32_t kOvertimeBufferSeconds = 2 * 3600;

// Pieces through every step: the smallest completed output over the steps.
std::int64_t CompletedOutput(const model::Order& order, const graph::StepGraph& graph, const std::vector<model::ScheduleEntry>& entries) {
  std::map<std::uint64_t, std::int64_t> by_step;
  for (const auto& entry : entries) {
    if (entry.status == model::EntryStatus::kCompleted) by_step[entry.step_id] += entry.actual_output.value_or(0);
  }

  std::optional<std::int64_t> through;
  for (auto step_id : graph.Order()) {
    const auto done = by_step.contains(step_id) ? by_step[step_id] : 0;
    through         = std::min(through.value_or(done), done);
  }
  return std::clamp<std::int64_t>(through.value_or(0), 0, order.quantity);
}

Feasibility AssessFeasibility(const calendar::ShiftCalendar& calendar, const model::Order& order, const graph::StepGraph& graph,
                              const AllocationRequest& request, const AllocationResult& allocation,
                              const std::vector<model::ScheduleEntry>& preserved, const AssignmentResolver& resolver,
                              const BookingLedger& ledger) {
  Feasibility out;
  out.completed_output = CompletedOutput(order, graph, preserved);
  out.remaining_output = order.quantity - out.completed_output;

  // Nothing left to plan always meets the deadline.
  std::optional<util::Date> last;
  std::int64_t              regular_seconds = 0;
  for (const auto& entry : allocation.entries) {
    last = std::max(last.value_or(entry.date), entry.date);
    regular_seconds += calendar.WorkingSecondsBetween(entry.date, entry.start_second, entry.end_second);
  }
  out.regular_hours_needed = static_cast<double>(regular_seconds) / 3600.0;
  out.can_meet_deadline    = !last || *last <= order.due_date;
  if (out.can_meet_deadline) return out;

  // Overtime goes to the first step in walk order that still has work.
  const model::Step* step = nullptr;
  for (auto step_id : graph.Order()) {
    auto it = request.quantities.find(step_id);
    if (it != request.quantities.end() && it->second > 0) {
      step = &graph.Step(step_id);
      break;
    }
  }
  if (!step) return out;

  std::int64_t late_seconds = 0;
  for (auto day = order.due_date + std::chrono::days{1}; day <= *last; day += std::chrono::days{1}) late_seconds += calendar.ShiftSeconds(day);
  const auto budget = late_seconds + kOvertimeBufferSeconds;

  BookingLedger scratch   = ledger;
  std::int64_t  generated = 0;
  for (auto day = request.start.date; day <= order.due_date && generated < budget; day += std::chrono::days{1}) {
    if (!calendar.IsWorkingDay(day) || calendar.OvertimeSeconds(day) <= 0) continue;

    OvertimeSuggestion block;
    block.date         = day;
    block.step_id      = step->id;
    block.start_second = calendar.DayEnd(day);
    block.end_second   = block.start_second + static_cast<std::int32_t>(std::min<std::int64_t>(calendar.OvertimeSeconds(day), budget - generated));
    block.planned_output =
        step->time_per_piece_seconds > 0 ? (block.end_second - block.start_second) / step->time_per_piece_seconds : request.quantities.at(step->id);

    auto crew = resolver.Resolve(order.id, *step, {day, block.start_second, block.end_second}, block.planned_output, scratch);
    if (!crew.unassigned()) block.worker_id = crew.assignments.front().worker_id;

    generated += block.end_second - block.start_second;
    out.overtime_suggestions.push_back(block);
  }
  out.overtime_hours_needed = static_cast<double>(generated) / 3600.0;
  return out;
}

} // namespace

ScheduleGenerator::ScheduleGenerator(std::shared_ptr<db::Repository> repository, std::shared_ptr<const calendar::ShiftCalendar> calendar,
                                     SchedulingOptions options, std::shared_ptr<OrderLocks> order_locks, NowFn now)
    : repository_(std::move(repository)),
      calendar_(std::move(calendar)),
      options_(options),
      order_locks_(order_locks ? std::move(order_locks) : std::make_shared<OrderLocks>()),
      now_(std::move(now)) {
}

util::Deadline ScheduleGenerator::ResolveDeadline(const std::optional<util::Deadline>& deadline) const {
  if (deadline) return *deadline;
  if (options_.generation_timeout_ms == 0) return {};
  return util::Deadline::After(std::chrono::milliseconds(options_.generation_timeout_ms));
}

calendar::SlotTime ScheduleGenerator::ResolveStart(const std::optional<calendar::SlotTime>& start) const {
  if (start) {
    return calendar_->NextOpenSlot(*start);
  }

  const auto local  = calendar_->LocalTime(now_());
  const auto today  = local.date;
  auto       second = local.second;

  const std::int32_t step = static_cast<std::int32_t>(std::max<std::uint32_t>(options_.start_rounding_minutes, 1)) * 60;
  second                  = ((second + step - 1) / step) * step;
  if (second >= util::kSecondsPerDay) {
    return calendar_->NextOpenSlot({today + std::chrono::days{1}, 0});
  }
  return calendar_->NextOpenSlot({today, second});
}

GenerationResult ScheduleGenerator::Generate(std::uint64_t order_id, std::optional<calendar::SlotTime> start, std::optional<util::Deadline> deadline) {
  observability::SpanScope span("ScheduleGenerator.Generate");
  span.SetAttribute("order.id", static_cast<std::int64_t>(order_id));
  const auto started = std::chrono::steady_clock::now();

  std::unique_lock<std::mutex> lock(order_locks_->For(order_id), std::try_to_lock);
  if (!lock.owns_lock()) {
    throw util::ConcurrencyConflict("schedule generation already running for order " + std::to_string(order_id));
  }

  const auto budget = ResolveDeadline(deadline);
  budget.Check("generation start");

  const auto now_ms = util::ToUnixMillis(now_());
  auto       input  = LoadPlanningInput(*repository_, order_id, options_, now_ms);
  if (input.order.status == model::OrderStatus::kInProgress) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument,
                                "order " + std::to_string(order_id) + " is in progress; replan its schedule instead");
  }

  AssignmentResolver resolver(input.snapshot, options_);
  SlotAllocator      allocator(*calendar_, resolver);
  BookingLedger      ledger(input.snapshot.bookings);

  AllocationRequest request;
  request.order_id = order_id;
  request.start    = ResolveStart(start);
  request.deadline = budget;
  for (auto step_id : input.graph.Order()) request.quantities[step_id] = input.order.quantity;

  auto allocation = allocator.Allocate(input.graph, request, ledger);

  GenerationResult result;
  result.feasibility = AssessFeasibility(*calendar_, input.order, input.graph, request, allocation, {}, resolver, ledger);
  result.warnings    = std::move(allocation.warnings);
  AddDueDateWarning(input.order, allocation, result.warnings);

  result.schedule.order_id        = order_id;
  result.schedule.start_date      = request.start.date;
  result.schedule.generated_at_ms = now_ms;
  result.schedule.entries         = std::move(allocation.entries);
  std::sort(result.schedule.entries.begin(), result.schedule.entries.end(), EntryBefore);

  budget.Check("commit");
  Commit(result.schedule);

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveGenerationDurationMs("generate", elapsed_ms);
  RecordWarningMetrics(result.warnings);
  SHOPFLOOR_LOG_INFO("schedule generated",
                     {observability::IntField("order_id", static_cast<std::int64_t>(order_id)),
                      observability::IntField("schedule_id", static_cast<std::int64_t>(result.schedule.id)),
                      observability::IntField("entries", static_cast<std::int64_t>(result.schedule.entries.size())),
                      observability::IntField("warnings", static_cast<std::int64_t>(result.warnings.size()))});
  return result;
}

GenerationResult ScheduleGenerator::Replan(std::uint64_t schedule_id, std::optional<calendar::SlotTime> start, const ReplanConstraints& constraints,
                                           std::optional<util::Deadline> deadline) {
  observability::SpanScope span("ScheduleGenerator.Replan");
  span.SetAttribute("schedule.id", static_cast<std::int64_t>(schedule_id));
  const auto started = std::chrono::steady_clock::now();

  std::uint64_t order_id = 0;
  {
    auto tx       = repository_->BeginRead();
    auto existing = repository_->GetSchedule(*tx, schedule_id);
    tx->Rollback();
    if (!existing) {
      throw util::NotFound("schedule " + std::to_string(schedule_id));
    }
    order_id = existing->order_id;
  }

  std::unique_lock<std::mutex> lock(order_locks_->For(order_id), std::try_to_lock);
  if (!lock.owns_lock()) {
    throw util::ConcurrencyConflict("schedule generation already running for order " + std::to_string(order_id));
  }

  const auto budget = ResolveDeadline(deadline);
  budget.Check("replan start");

  model::Schedule current;
  {
    auto tx       = repository_->BeginRead();
    auto existing = repository_->GetSchedule(*tx, schedule_id);
    tx->Rollback();
    if (!existing) {
      throw util::NotFound("schedule " + std::to_string(schedule_id));
    }
    current = std::move(*existing);
  }

  const auto now_ms = util::ToUnixMillis(now_());
  auto       input  = LoadPlanningInput(*repository_, order_id, options_, now_ms);

  auto options = options_;
  if (constraints.max_crew_size) options.max_crew_size = *constraints.max_crew_size;

  AssignmentResolver resolver(input.snapshot, options, constraints.excluded_workers);
  SlotAllocator      allocator(*calendar_, resolver);
  BookingLedger      ledger(input.snapshot.bookings);

  AllocationRequest request;
  request.order_id = order_id;
  request.start    = ResolveStart(start);
  request.deadline = budget;
  for (auto step_id : input.graph.Order()) request.quantities[step_id] = input.order.quantity;

  // Started and completed work stays as logged; only the remainder is re-planned.
  std::vector<model::ScheduleEntry> preserved;
  if (!constraints.discard_actuals) {
    for (auto& entry : current.entries) {
      if (entry.status == model::EntryStatus::kNotStarted || !input.graph.Contains(entry.step_id)) continue;

      auto& remaining = request.quantities[entry.step_id];
      remaining -= entry.status == model::EntryStatus::kCompleted ? entry.actual_output.value_or(entry.planned_output) : entry.planned_output;
      remaining = std::max<std::int64_t>(remaining, 0);

      const calendar::SlotTime end{entry.date, entry.actual_end_second.value_or(entry.end_second)};
      auto [it, inserted] = request.fixed_completions.emplace(entry.step_id, end);
      if (!inserted && it->second < end) it->second = end;

      for (const auto& assignment : entry.assignments) {
        ledger.Add({assignment.worker_id, order_id, entry.date, entry.start_second, entry.end_second});
      }
      preserved.push_back(std::move(entry));
    }
  }

  auto allocation = allocator.Allocate(input.graph, request, ledger);

  GenerationResult result;
  result.feasibility = AssessFeasibility(*calendar_, input.order, input.graph, request, allocation, preserved, resolver, ledger);
  result.warnings    = std::move(allocation.warnings);
  AddDueDateWarning(input.order, allocation, result.warnings);

  result.schedule.order_id        = order_id;
  result.schedule.start_date      = request.start.date;
  result.schedule.generated_at_ms = now_ms;
  result.schedule.entries         = std::move(preserved);
  for (auto& entry : allocation.entries) result.schedule.entries.push_back(std::move(entry));
  std::sort(result.schedule.entries.begin(), result.schedule.entries.end(), EntryBefore);

  budget.Check("commit");
  Commit(result.schedule);

  const auto elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  observability::Metrics::Instance().ObserveGenerationDurationMs("replan", elapsed_ms);
  RecordWarningMetrics(result.warnings);
  SHOPFLOOR_LOG_INFO("schedule replanned",
                     {observability::IntField("order_id", static_cast<std::int64_t>(order_id)),
                      observability::IntField("previous_schedule_id", static_cast<std::int64_t>(schedule_id)),
                      observability::IntField("schedule_id", static_cast<std::int64_t>(result.schedule.id)),
                      observability::BoolField("discard_actuals", constraints.discard_actuals)});
  return result;
}

model::Schedule ScheduleGenerator::GetSchedule(std::uint64_t schedule_id) {
  auto tx       = repository_->BeginRead();
  auto schedule = repository_->GetSchedule(*tx, schedule_id);
  tx->Rollback();
  if (!schedule) {
    throw util::NotFound("schedule " + std::to_string(schedule_id));
  }
  return *schedule;
}

void ScheduleGenerator::Commit(model::Schedule& schedule) {
  const auto entries = schedule.entries;

  db::WithWriteRetry(options_.write_retry_limit, "schedule write for order " + std::to_string(schedule.order_id), [&] {
    schedule.entries = entries;

    auto tx    = repository_->Begin();
    auto order = repository_->GetOrder(*tx, schedule.order_id);
    if (!order) {
      throw util::NotFound("order " + std::to_string(schedule.order_id));
    }

    db::ThrowIfDbError(repository_->ReplaceSchedule(*tx, schedule), "replace schedule");

    if (order->status == model::OrderStatus::kPending) {
      if (!model::CanTransition(order->status, model::OrderStatus::kScheduled)) {
        throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument, "order cannot move to scheduled");
      }
      db::ThrowIfDbError(repository_->UpdateOrderStatus(*tx, order->id, model::OrderStatus::kScheduled), "update order status");
    }

    tx->Commit();
  });
}

} // namespace shopfloor::scheduling
