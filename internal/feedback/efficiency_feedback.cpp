#include "efficiency_feedback.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <tuple>

#include "internal/db/api/retry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace shopfloor::feedback {

using util::ValidationError;
using util::ValidationErrorKind;

namespace {

constexpr std::uint32_t kWriteRetryLimit = 3;
constexpr std::uint64_t kMillisPerDay    = 24ULL * 60 * 60 * 1000;

std::string_view ReasonName(model::ProficiencyReason reason) {
  switch (reason) {
    case model::ProficiencyReason::kManual:
      return "manual";
    case model::ProficiencyReason::kAutoIncrease:
      return "auto_increase";
    case model::ProficiencyReason::kAutoDecrease:
      return "auto_decrease";
  }
  return "unknown";
}

void ValidateSecondOfDay(std::int32_t second, const char* what) {
  if (second < 0 || second > util::kSecondsPerDay) {
    throw ValidationError(ValidationErrorKind::kInvalidActuals, std::string(what) + " outside the day: " + std::to_string(second));
  }
}

model::ScheduleEntry LoadEntry(db::Repository& repository, db::Transaction& tx, std::uint64_t entry_id) {
  auto entry = repository.GetEntry(tx, entry_id);
  if (!entry) {
    throw util::NotFound("schedule entry " + std::to_string(entry_id));
  }
  return *entry;
}

std::uint64_t OrderOfEntry(db::Repository& repository, std::uint64_t entry_id) {
  auto tx    = repository.BeginRead();
  auto entry = LoadEntry(repository, *tx, entry_id);
  tx->Rollback();
  return entry.order_id;
}

} // namespace

// ------------------------------------------------------------------
// Efficiency arithmetic
// ------------------------------------------------------------------

std::optional<std::int32_t> ActualWorkingSeconds(const calendar::ShiftCalendar& calendar, const model::ScheduleEntry& entry) {
  if (!entry.actual_end_second) return std::nullopt;

  const auto start = entry.actual_start_second.value_or(entry.start_second);
  const auto end   = *entry.actual_end_second;
  if (end <= start) return 0;
  if (!calendar.IsWorkingDay(entry.date)) return end - start;

  const auto day_start = calendar.DayStart(entry.date);
  const auto day_end   = calendar.DayEnd(entry.date);

  const auto before = std::max(0, std::min(end, day_start) - start);
  const auto within = calendar.WorkingSecondsBetween(entry.date, std::max(start, day_start), std::min(end, day_end));
  const auto after  = std::max(0, end - std::max(start, day_end));
  return before + within + after;
}

std::vector<std::int64_t> ActualShares(const model::ScheduleEntry& entry) {
  std::vector<std::int64_t> shares(entry.assignments.size(), 0);
  if (shares.empty()) return shares;

  const auto   actual        = entry.actual_output.value_or(0);
  std::int64_t planned_total = 0;
  for (const auto& a : entry.assignments) planned_total += a.planned_output;

  std::int64_t assigned = 0;
  std::size_t  leader   = 0;
  for (std::size_t i = 0; i < shares.size(); ++i) {
    const auto weight = planned_total > 0 ? entry.assignments[i].planned_output : 1;
    const auto total  = planned_total > 0 ? planned_total : static_cast<std::int64_t>(shares.size());
    shares[i]         = actual * weight / total;
    assigned += shares[i];
    if (entry.assignments[i].planned_output > entry.assignments[leader].planned_output) leader = i;
  }
  shares[leader] += actual - assigned;
  return shares;
}

std::optional<double> WorkerEfficiency(const calendar::ShiftCalendar& calendar, const model::ScheduleEntry& entry, std::uint64_t worker_id,
                                       std::int64_t time_per_piece_seconds) {
  if (entry.status != model::EntryStatus::kCompleted || time_per_piece_seconds <= 0) return std::nullopt;

  const auto seconds = ActualWorkingSeconds(calendar, entry);
  if (!seconds || *seconds <= 0) return std::nullopt;

  const auto shares = ActualShares(entry);
  for (std::size_t i = 0; i < entry.assignments.size(); ++i) {
    if (entry.assignments[i].worker_id != worker_id) continue;
    const double expected = static_cast<double>(shares[i]) * static_cast<double>(time_per_piece_seconds);
    return expected / static_cast<double>(*seconds) * 100.0;
  }
  return std::nullopt;
}

std::optional<double> EntryEfficiency(const calendar::ShiftCalendar& calendar, const model::ScheduleEntry& entry,
                                      std::int64_t time_per_piece_seconds) {
  if (entry.status != model::EntryStatus::kCompleted || time_per_piece_seconds <= 0) return std::nullopt;

  const auto seconds = ActualWorkingSeconds(calendar, entry);
  if (!seconds || *seconds <= 0) return std::nullopt;

  const auto   crew     = std::max<std::size_t>(entry.assignments.size(), 1);
  const double expected = static_cast<double>(entry.actual_output.value_or(0)) * static_cast<double>(time_per_piece_seconds);
  return expected / (static_cast<double>(crew) * static_cast<double>(*seconds)) * 100.0;
}

// ------------------------------------------------------------------
// EfficiencyFeedback
// ------------------------------------------------------------------

EfficiencyFeedback::EfficiencyFeedback(std::shared_ptr<db::Repository> repository, std::shared_ptr<const calendar::ShiftCalendar> calendar,
                                       FeedbackOptions options, std::shared_ptr<scheduling::OrderLocks> order_locks, NowFn now)
    : repository_(std::move(repository)),
      calendar_(std::move(calendar)),
      options_(options),
      order_locks_(order_locks ? std::move(order_locks) : std::make_shared<scheduling::OrderLocks>()),
      now_(std::move(now)) {
}

model::Step EfficiencyFeedback::StepOf(db::Transaction& tx, const model::ScheduleEntry& entry) {
  auto step = repository_->GetStep(tx, entry.step_id);
  if (!step) {
    throw util::NotFound("step " + std::to_string(entry.step_id));
  }
  return *step;
}

model::ScheduleEntry EfficiencyFeedback::RecordStart(std::uint64_t entry_id, std::optional<std::int32_t> actual_start_second) {
  observability::SpanScope span("EfficiencyFeedback.RecordStart");
  if (actual_start_second) ValidateSecondOfDay(*actual_start_second, "actual start");

  const auto                  order_id = OrderOfEntry(*repository_, entry_id);
  std::lock_guard<std::mutex> lock(order_locks_->For(order_id));

  auto entry = db::WithWriteRetry(kWriteRetryLimit, "record start", [&] {
    auto tx    = repository_->Begin();
    auto entry = LoadEntry(*repository_, *tx, entry_id);
    if (!model::CanTransition(entry.status, model::EntryStatus::kInProgress)) {
      throw ValidationError(ValidationErrorKind::kInvalidActuals, "entry " + std::to_string(entry_id) + " has already started");
    }

    entry.status              = model::EntryStatus::kInProgress;
    entry.actual_start_second = actual_start_second.value_or(entry.start_second);
    db::ThrowIfDbError(repository_->UpdateEntryProgress(*tx, entry), "update entry");

    auto order = repository_->GetOrder(*tx, entry.order_id);
    if (!order) {
      throw util::NotFound("order " + std::to_string(entry.order_id));
    }
    if (order->status == model::OrderStatus::kScheduled) {
      db::ThrowIfDbError(repository_->UpdateOrderStatus(*tx, order->id, model::OrderStatus::kInProgress), "update order status");
    }

    tx->Commit();
    return entry;
  });

  SHOPFLOOR_LOG_INFO("entry started", {observability::IntField("entry_id", static_cast<std::int64_t>(entry_id)),
                                       observability::IntField("order_id", static_cast<std::int64_t>(order_id))});
  return entry;
}

CompletionResult EfficiencyFeedback::RecordCompletion(std::uint64_t entry_id, std::int64_t actual_output, std::int32_t actual_end_second) {
  observability::SpanScope span("EfficiencyFeedback.RecordCompletion");
  span.SetAttribute("entry.id", static_cast<std::int64_t>(entry_id));

  if (actual_output < 0) {
    throw ValidationError(ValidationErrorKind::kInvalidActuals, "actual output must not be negative");
  }
  ValidateSecondOfDay(actual_end_second, "actual end");

  CompletionResult result;
  std::int64_t     time_per_piece_seconds = 0;
  {
    const auto                  order_id = OrderOfEntry(*repository_, entry_id);
    std::lock_guard<std::mutex> lock(order_locks_->For(order_id));

    result.entry = db::WithWriteRetry(kWriteRetryLimit, "record completion", [&] {
      auto tx    = repository_->Begin();
      auto entry = LoadEntry(*repository_, *tx, entry_id);
      if (!model::CanTransition(entry.status, model::EntryStatus::kCompleted)) {
        throw ValidationError(ValidationErrorKind::kInvalidActuals, "entry " + std::to_string(entry_id) + " is already completed");
      }

      const auto start = entry.actual_start_second.value_or(entry.start_second);
      if (actual_end_second < start) {
        throw ValidationError(ValidationErrorKind::kInvalidActuals, "actual end " + util::FormatTimeOfDay(actual_end_second) +
                                                                        " precedes start " + util::FormatTimeOfDay(start));
      }

      entry.status              = model::EntryStatus::kCompleted;
      entry.actual_start_second = start;
      entry.actual_end_second   = actual_end_second;
      entry.actual_output       = actual_output;
      entry.completed_at_ms     = util::ToUnixMillis(now_());
      db::ThrowIfDbError(repository_->UpdateEntryProgress(*tx, entry), "update entry");

      auto order = repository_->GetOrder(*tx, entry.order_id);
      if (!order) {
        throw util::NotFound("order " + std::to_string(entry.order_id));
      }

      bool all_done = true;
      if (auto schedule = repository_->GetScheduleForOrder(*tx, order->id)) {
        all_done = std::all_of(schedule->entries.begin(), schedule->entries.end(),
                               [](const model::ScheduleEntry& e) { return e.status == model::EntryStatus::kCompleted; });
      }
      const auto next = model::StatusAfterProgress(all_done);
      if (order->status != next && model::CanTransition(order->status, next)) {
        db::ThrowIfDbError(repository_->UpdateOrderStatus(*tx, order->id, next), "update order status");
      }

      time_per_piece_seconds = StepOf(*tx, entry).time_per_piece_seconds;
      tx->Commit();
      return entry;
    });
  }

  for (const auto& assignment : result.entry.assignments) {
    std::lock_guard<std::mutex> pair_lock(pair_locks_.For({assignment.worker_id, result.entry.step_id}));
    if (auto change = EvaluateWorker(assignment.worker_id, result.entry.step_id, time_per_piece_seconds)) {
      result.proficiency_changes.push_back(*change);
    }
  }
  result.assignments = Analyze(result.entry, time_per_piece_seconds);

  SHOPFLOOR_LOG_INFO("entry completed", {observability::IntField("entry_id", static_cast<std::int64_t>(entry_id)),
                                         observability::IntField("actual_output", actual_output),
                                         observability::IntField("proficiency_changes", static_cast<std::int64_t>(result.proficiency_changes.size()))});
  return result;
}

std::optional<model::ProficiencyHistory> EfficiencyFeedback::EvaluateWorker(std::uint64_t worker_id, std::uint64_t step_id,
                                                                             std::int64_t time_per_piece_seconds) {
  const auto now_ms   = util::ToUnixMillis(now_());
  const auto lookback = static_cast<std::uint64_t>(options_.lookback_days) * kMillisPerDay;
  const auto cutoff   = now_ms > lookback ? now_ms - lookback : 0;

  auto change = db::WithWriteRetry(kWriteRetryLimit, "proficiency update", [&]() -> std::optional<model::ProficiencyHistory> {
    auto tx      = repository_->Begin();
    auto current = repository_->GetProficiency(*tx, worker_id, step_id);

    const auto level = current ? current->level : model::kDefaultProficiency;
    const auto since = current ? current->updated_at_ms : 0;

    // Newest first: stop at the last change or the lookback edge.
    std::vector<double> samples;
    for (const auto& entry : repository_->ListCompletedEntries(*tx, worker_id, step_id)) {
      if (entry.completed_at_ms <= since || entry.completed_at_ms < cutoff) break;
      if (auto efficiency = WorkerEfficiency(*calendar_, entry, worker_id, time_per_piece_seconds)) samples.push_back(*efficiency);
      if (samples.size() >= options_.window_size) break;
    }
    if (samples.empty() || samples.size() < options_.min_samples) {
      tx->Rollback();
      return std::nullopt;
    }

    double sum = 0.0;
    for (auto sample : samples) sum += sample;
    const double average = sum / static_cast<double>(samples.size());

    model::ProficiencyHistory record;
    record.worker_id          = worker_id;
    record.step_id            = step_id;
    record.old_level          = level;
    record.average_efficiency = average;
    record.sample_size        = static_cast<std::int32_t>(samples.size());
    record.recorded_at_ms     = now_ms;

    if (average > options_.increase_threshold_percent && level < model::kMaxProficiency) {
      record.new_level = level + 1;
      record.reason    = model::ProficiencyReason::kAutoIncrease;
    } else if (average < options_.decrease_threshold_percent && level > model::kMinProficiency) {
      record.new_level = level - 1;
      record.reason    = model::ProficiencyReason::kAutoDecrease;
    } else {
      tx->Rollback();
      return std::nullopt;
    }

    db::ThrowIfDbError(repository_->UpsertProficiency(*tx, {worker_id, step_id, record.new_level, now_ms}), "update proficiency");
    db::ThrowIfDbError(repository_->AppendProficiencyHistory(*tx, record), "append proficiency history");
    tx->Commit();
    return record;
  });

  if (change) {
    observability::Metrics::Instance().RecordProficiencyChange(ReasonName(change->reason));
    SHOPFLOOR_LOG_INFO("proficiency adjusted",
                       {observability::IntField("worker_id", static_cast<std::int64_t>(worker_id)),
                        observability::IntField("step_id", static_cast<std::int64_t>(step_id)),
                        observability::IntField("old_level", change->old_level), observability::IntField("new_level", change->new_level),
                        observability::DoubleField("average_efficiency", change->average_efficiency.value_or(0.0)),
                        observability::StringField("reason", ReasonName(change->reason))});
  }
  return change;
}

std::optional<model::ProficiencyHistory> EfficiencyFeedback::SetProficiency(std::uint64_t worker_id, std::uint64_t step_id, std::int32_t level) {
  if (level < model::kMinProficiency || level > model::kMaxProficiency) {
    throw ValidationError(ValidationErrorKind::kInvalidArgument, "proficiency level " + std::to_string(level) + " outside 1..5");
  }

  std::lock_guard<std::mutex> pair_lock(pair_locks_.For({worker_id, step_id}));
  const auto                  now_ms = util::ToUnixMillis(now_());

  auto change = db::WithWriteRetry(kWriteRetryLimit, "set proficiency", [&]() -> std::optional<model::ProficiencyHistory> {
    auto tx = repository_->Begin();
    if (!repository_->GetWorker(*tx, worker_id)) {
      throw util::NotFound("worker " + std::to_string(worker_id));
    }
    if (!repository_->GetStep(*tx, step_id)) {
      throw util::NotFound("step " + std::to_string(step_id));
    }

    auto       current = repository_->GetProficiency(*tx, worker_id, step_id);
    const auto old     = current ? current->level : model::kDefaultProficiency;
    if (old == level) {
      tx->Rollback();
      return std::nullopt;
    }

    model::ProficiencyHistory record;
    record.worker_id      = worker_id;
    record.step_id        = step_id;
    record.old_level      = old;
    record.new_level      = level;
    record.reason         = model::ProficiencyReason::kManual;
    record.recorded_at_ms = now_ms;

    db::ThrowIfDbError(repository_->UpsertProficiency(*tx, {worker_id, step_id, level, now_ms}), "update proficiency");
    db::ThrowIfDbError(repository_->AppendProficiencyHistory(*tx, record), "append proficiency history");
    tx->Commit();
    return record;
  });

  if (change) {
    observability::Metrics::Instance().RecordProficiencyChange(ReasonName(change->reason));
  }
  return change;
}

std::vector<AssignmentAnalytics> EfficiencyFeedback::Analyze(const model::ScheduleEntry& entry, std::int64_t time_per_piece_seconds) const {
  const bool completed = entry.status == model::EntryStatus::kCompleted;
  const auto shares    = ActualShares(entry);
  const auto seconds   = completed ? ActualWorkingSeconds(*calendar_, entry).value_or(0) : 0;

  std::vector<AssignmentAnalytics> out;
  for (std::size_t i = 0; i < entry.assignments.size(); ++i) {
    const auto& assignment = entry.assignments[i];

    AssignmentAnalytics analytics;
    analytics.worker_id      = assignment.worker_id;
    analytics.planned_output = assignment.planned_output;
    analytics.actual_output  = completed ? shares[i] : 0;

    const auto units           = completed ? shares[i] : assignment.planned_output;
    analytics.expected_minutes = static_cast<double>(units) * static_cast<double>(time_per_piece_seconds) / 60.0;
    analytics.actual_minutes   = static_cast<double>(seconds) / 60.0;
    analytics.efficiency_percent = WorkerEfficiency(*calendar_, entry, assignment.worker_id, time_per_piece_seconds);
    out.push_back(analytics);
  }
  return out;
}

std::vector<AssignmentAnalytics> EfficiencyFeedback::GetAssignmentAnalytics(std::uint64_t entry_id) {
  auto tx    = repository_->BeginRead();
  auto entry = LoadEntry(*repository_, *tx, entry_id);
  auto step  = StepOf(*tx, entry);
  tx->Rollback();
  return Analyze(entry, step.time_per_piece_seconds);
}

std::vector<model::ProficiencyHistory> EfficiencyFeedback::GetProficiencyHistory(std::uint64_t worker_id, std::optional<std::uint64_t> step_id) {
  auto tx = repository_->BeginRead();
  if (!repository_->GetWorker(*tx, worker_id)) {
    throw util::NotFound("worker " + std::to_string(worker_id));
  }
  if (step_id && !repository_->GetStep(*tx, *step_id)) {
    throw util::NotFound("step " + std::to_string(*step_id));
  }

  auto history = repository_->ListProficiencyHistory(*tx, worker_id);
  tx->Rollback();

  if (step_id) {
    history.erase(std::remove_if(history.begin(), history.end(), [&](const model::ProficiencyHistory& r) { return r.step_id != *step_id; }),
                  history.end());
  }
  std::stable_sort(history.begin(), history.end(), [](const model::ProficiencyHistory& a, const model::ProficiencyHistory& b) {
    return std::tie(a.recorded_at_ms, a.id) < std::tie(b.recorded_at_ms, b.id);
  });
  return history;
}

WorkerProductivity EfficiencyFeedback::GetWorkerProductivity(std::uint64_t worker_id) {
  auto tx     = repository_->BeginRead();
  auto worker = repository_->GetWorker(*tx, worker_id);
  if (!worker) {
    throw util::NotFound("worker " + std::to_string(worker_id));
  }

  WorkerProductivity productivity;
  productivity.worker_id = worker_id;
  productivity.name      = worker->name;

  std::map<std::uint64_t, StepProductivity>    by_step;
  std::map<std::uint64_t, std::vector<double>> step_samples;
  std::vector<double>                          all_samples;

  for (const auto& entry : repository_->ListEntries(*tx)) {
    if (entry.status != model::EntryStatus::kCompleted || !entry.HasWorker(worker_id)) continue;

    auto [it, inserted] = by_step.try_emplace(entry.step_id);
    auto& step          = it->second;
    std::int64_t tpp    = 0;
    if (auto definition = repository_->GetStep(*tx, entry.step_id)) {
      tpp = definition->time_per_piece_seconds;
      if (inserted) step.step_name = definition->name;
    }
    if (inserted) {
      step.step_id = entry.step_id;
      auto level   = repository_->GetProficiency(*tx, worker_id, entry.step_id);
      step.proficiency_level = level ? level->level : model::kDefaultProficiency;
    }

    const auto shares = ActualShares(entry);
    for (std::size_t i = 0; i < entry.assignments.size(); ++i) {
      if (entry.assignments[i].worker_id == worker_id) step.units += shares[i];
    }
    step.hours += static_cast<double>(ActualWorkingSeconds(*calendar_, entry).value_or(0)) / 3600.0;
    ++step.completed_entries;

    if (auto efficiency = WorkerEfficiency(*calendar_, entry, worker_id, tpp)) {
      step_samples[entry.step_id].push_back(*efficiency);
      all_samples.push_back(*efficiency);
    }
  }
  tx->Rollback();

  auto mean = [](const std::vector<double>& values) -> std::optional<double> {
    if (values.empty()) return std::nullopt;
    double sum = 0.0;
    for (auto v : values) sum += v;
    return sum / static_cast<double>(values.size());
  };

  for (auto& [step_id, step] : by_step) {
    step.average_efficiency = mean(step_samples[step_id]);
    productivity.completed_entries += step.completed_entries;
    productivity.total_units += step.units;
    productivity.total_hours += step.hours;
    productivity.steps.push_back(std::move(step));
  }
  productivity.average_efficiency = mean(all_samples);
  return productivity;
}

} // namespace shopfloor::feedback
