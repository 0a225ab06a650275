#include "capacity_analyzer.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <string>

#include "internal/model/worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace shopfloor::analysis {

namespace {

constexpr double        kEpsilonHours = 1e-9;
constexpr std::uint64_t kMillisPerDay = 24ULL * 60 * 60 * 1000;

struct PoolWorker {
  model::Worker         worker;
  std::optional<double> hours_per_day;
};

double Mean(const std::vector<double>& values) {
  double sum = 0.0;
  for (auto v : values) sum += v;
  return values.empty() ? 0.0 : sum / static_cast<double>(values.size());
}

bool IsOpenEntry(const model::ScheduleEntry& entry) {
  return entry.status != model::EntryStatus::kCompleted;
}

} // namespace

double UtilizationPercent(double required_hours, double available_hours) {
  if (available_hours <= 0.0) {
    return required_hours <= 0.0 ? 0.0 : std::numeric_limits<double>::infinity();
  }
  return required_hours / available_hours * 100.0;
}

struct CapacityAnalyzer::View {
  util::Date    as_of{};
  std::uint64_t now_ms = 0;

  std::vector<model::Order>                                 open_orders;
  std::map<std::uint64_t, std::vector<model::Step>>         steps_by_product;
  std::map<std::uint64_t, model::Step>                      steps;
  std::map<std::uint64_t, std::vector<model::ScheduleEntry>> open_schedules;
  std::vector<model::ScheduleEntry>                         entries;
  std::vector<PoolWorker>                                   pool;

  std::optional<double>                    workforce_factor;
  std::map<std::uint64_t, double>          order_factor;

  double WorkerHours(const calendar::ShiftCalendar& calendar, const PoolWorker& w, util::Date date) const {
    if (!calendar.IsWorkingDay(date)) return 0.0;
    return w.hours_per_day ? std::max(0.0, *w.hours_per_day) : calendar.ShiftHours(date);
  }

  double WorkerHoursBetween(const calendar::ShiftCalendar& calendar, const PoolWorker& w, util::Date first, util::Date last) const {
    double hours = 0.0;
    for (auto day = first; day <= last; day += std::chrono::days{1}) hours += WorkerHours(calendar, w, day);
    return hours;
  }

  double EfficiencyFactor(std::uint64_t order_id) const {
    if (auto it = order_factor.find(order_id); it != order_factor.end()) return it->second;
    return workforce_factor.value_or(1.0);
  }
};

CapacityAnalyzer::CapacityAnalyzer(std::shared_ptr<db::Repository> repository, std::shared_ptr<const calendar::ShiftCalendar> calendar,
                                   scheduling::SchedulingOptions scheduling, feedback::FeedbackOptions feedback, NowFn now)
    : repository_(std::move(repository)), calendar_(std::move(calendar)), scheduling_(scheduling), feedback_(feedback), now_(std::move(now)) {
}

util::Date CapacityAnalyzer::AsOf(const AnalysisOptions& options) const {
  if (options.as_of) return *options.as_of;
  return calendar_->LocalTime(now_()).date;
}

CapacityAnalyzer::View CapacityAnalyzer::Load(const AnalysisOptions& options) {
  View view;
  view.as_of  = AsOf(options);
  view.now_ms = util::ToUnixMillis(now_());

  auto tx = repository_->BeginRead();

  for (auto& order : repository_->ListOrders(*tx)) {
    if (!model::IsOpen(order.status)) continue;
    if (!view.steps_by_product.count(order.product_id)) {
      auto steps = repository_->ListSteps(*tx, order.product_id);
      for (const auto& step : steps) view.steps.emplace(step.id, step);
      view.steps_by_product.emplace(order.product_id, std::move(steps));
    }
    if (auto schedule = repository_->GetScheduleForOrder(*tx, order.id)) {
      view.open_schedules.emplace(order.id, std::move(schedule->entries));
    }
    view.open_orders.push_back(std::move(order));
  }
  std::sort(view.open_orders.begin(), view.open_orders.end(), [](const model::Order& a, const model::Order& b) { return a.id < b.id; });

  view.entries = repository_->ListEntries(*tx);
  for (const auto& entry : view.entries) {
    if (view.steps.count(entry.step_id)) continue;
    if (auto step = repository_->GetStep(*tx, entry.step_id)) view.steps.emplace(step->id, *step);
  }

  std::map<std::uint64_t, WorkerOverride> overrides;
  for (const auto& o : options.overrides) overrides[o.worker_id] = o;

  auto workers = repository_->ListWorkers(*tx);
  tx->Rollback();

  std::sort(workers.begin(), workers.end(), [](const model::Worker& a, const model::Worker& b) { return a.id < b.id; });
  for (auto& worker : workers) {
    if (worker.status != model::WorkerStatus::kActive) continue;
    PoolWorker member{std::move(worker), std::nullopt};
    if (auto it = overrides.find(member.worker.id); it != overrides.end()) {
      if (!it->second.available) continue;
      member.hours_per_day = it->second.hours_per_day;
    }
    view.pool.push_back(std::move(member));
  }

  // Trailing efficiency: completed entries inside the lookback window.
  const auto lookback = static_cast<std::uint64_t>(feedback_.lookback_days) * kMillisPerDay;
  const auto cutoff   = view.now_ms > lookback ? view.now_ms - lookback : 0;

  std::vector<double>                          workforce;
  std::map<std::uint64_t, std::vector<double>> by_order;
  for (const auto& entry : view.entries) {
    if (entry.status != model::EntryStatus::kCompleted || entry.completed_at_ms < cutoff) continue;
    auto step = view.steps.find(entry.step_id);
    if (step == view.steps.end()) continue;
    if (auto efficiency = feedback::EntryEfficiency(*calendar_, entry, step->second.time_per_piece_seconds)) {
      workforce.push_back(*efficiency);
      by_order[entry.order_id].push_back(*efficiency);
    }
  }

  const auto min_samples = std::max<std::size_t>(feedback_.min_samples, 1);
  if (workforce.size() >= min_samples && Mean(workforce) > 0.0) {
    view.workforce_factor = Mean(workforce) / 100.0;
  }
  for (const auto& [order_id, samples] : by_order) {
    if (samples.size() >= min_samples && Mean(samples) > 0.0) view.order_factor[order_id] = Mean(samples) / 100.0;
  }
  return view;
}

std::vector<DeadlineRisk> CapacityAnalyzer::Risks(const View& view) const {
  std::vector<DeadlineRisk> risks;

  for (const auto& order : view.open_orders) {
    DeadlineRisk risk;
    risk.order_id       = order.id;
    risk.product_id     = order.product_id;
    risk.due_date       = order.due_date;
    risk.days_until_due = util::DaysBetween(view.as_of, order.due_date);
    risk.quantity       = order.quantity;
    risk.status         = order.status;

    const auto  product   = view.steps_by_product.find(order.product_id);
    const auto  schedule  = view.open_schedules.find(order.id);
    const auto& steps     = product != view.steps_by_product.end() ? product->second : std::vector<model::Step>{};
    const auto  factor    = view.EfficiencyFactor(order.id);
    std::map<model::SkillCategory, double> required;

    for (const auto& step : steps) {
      std::int64_t remaining = order.quantity;
      if (schedule != view.open_schedules.end()) {
        remaining = 0;
        for (const auto& entry : schedule->second) {
          if (entry.step_id != step.id || !IsOpenEntry(entry)) continue;
          remaining += entry.planned_output;
          if (entry.status == model::EntryStatus::kInProgress) remaining -= entry.actual_output.value_or(0);
        }
        remaining = std::max<std::int64_t>(remaining, 0);
      }
      required[step.required_skill] +=
          static_cast<double>(remaining) * static_cast<double>(step.time_per_piece_seconds) / 3600.0 / factor;
    }

    std::set<std::uint64_t> eligible_any;
    for (const auto& [skill, hours] : required) {
      SkillCapacity capacity;
      capacity.skill          = skill;
      capacity.required_hours = hours;
      for (const auto& member : view.pool) {
        if (!model::SkillCovers(member.worker.skill, skill, scheduling_.sewing_workers_cover_other)) continue;
        ++capacity.eligible_workers;
        eligible_any.insert(member.worker.id);
        if (order.due_date >= view.as_of) capacity.available_hours += view.WorkerHoursBetween(*calendar_, member, view.as_of, order.due_date);
      }

      const auto gap = capacity.required_hours - capacity.available_hours;
      if (gap > kEpsilonHours) {
        risk.can_meet = false;
        risk.shortfall_hours += gap;
      }
      risk.required_hours += capacity.required_hours;
      risk.skills.push_back(capacity);
    }

    if (order.due_date >= view.as_of) {
      for (const auto& member : view.pool) {
        if (eligible_any.count(member.worker.id)) risk.available_hours += view.WorkerHoursBetween(*calendar_, member, view.as_of, order.due_date);
      }
    }
    risks.push_back(std::move(risk));
  }

  std::sort(risks.begin(), risks.end(), [](const DeadlineRisk& a, const DeadlineRisk& b) {
    if (a.days_until_due != b.days_until_due) return a.days_until_due < b.days_until_due;
    return a.order_id < b.order_id;
  });
  return risks;
}

namespace {

// Labor hours of a planned entry: its working window times its crew.
double EntryLaborHours(const calendar::ShiftCalendar& calendar, const model::ScheduleEntry& entry) {
  const auto seconds = calendar.WorkingSecondsBetween(entry.date, entry.start_second, entry.end_second);
  const auto crew    = std::max<std::size_t>(entry.assignments.size(), 1);
  return static_cast<double>(seconds) * static_cast<double>(crew) / 3600.0;
}

} // namespace

CapacityAnalysis CapacityAnalyzer::Capacity(const View& view, std::int32_t weeks) const {
  CapacityAnalysis analysis;
  analysis.weeks          = weeks;
  analysis.active_workers = static_cast<std::int32_t>(view.pool.size());

  const auto first_week = util::StartOfIsoWeek(view.as_of);
  std::map<util::Date, double> required_by_week;
  for (const auto& [order_id, entries] : view.open_schedules) {
    for (const auto& entry : entries) {
      if (IsOpenEntry(entry)) required_by_week[util::StartOfIsoWeek(entry.date)] += EntryLaborHours(*calendar_, entry);
    }
  }

  for (std::int32_t i = 0; i < weeks; ++i) {
    WeeklyCapacity week;
    week.week_start = first_week + std::chrono::days{7 * i};
    for (const auto& member : view.pool) {
      week.available_hours += view.WorkerHoursBetween(*calendar_, member, week.week_start, week.week_start + std::chrono::days{6});
    }
    if (auto it = required_by_week.find(week.week_start); it != required_by_week.end()) week.required_hours = it->second;
    week.utilization_percent = UtilizationPercent(week.required_hours, week.available_hours);

    analysis.total_available_hours += week.available_hours;
    analysis.total_required_hours += week.required_hours;
    analysis.weekly.push_back(week);
  }

  for (const auto& order : view.open_orders) {
    if (view.open_schedules.count(order.id)) continue;
    auto product = view.steps_by_product.find(order.product_id);
    if (product == view.steps_by_product.end()) continue;

    double seconds = 0.0;
    for (const auto& step : product->second) seconds += static_cast<double>(order.quantity) * static_cast<double>(step.time_per_piece_seconds);
    analysis.unscheduled_required_hours += seconds / 3600.0 / view.EfficiencyFactor(order.id);
  }
  analysis.total_required_hours += analysis.unscheduled_required_hours;
  analysis.utilization_percent = UtilizationPercent(analysis.total_required_hours, analysis.total_available_hours);
  return analysis;
}

std::vector<DeadlineRisk> CapacityAnalyzer::GetDeadlineRisks(const AnalysisOptions& options) {
  observability::SpanScope span("CapacityAnalyzer.GetDeadlineRisks");
  auto risks = Risks(Load(options));

  const auto at_risk = std::count_if(risks.begin(), risks.end(), [](const DeadlineRisk& r) { return !r.can_meet; });
  observability::Metrics::Instance().ObserveOrdersAtRisk(static_cast<std::uint64_t>(at_risk), risks.size());
  SHOPFLOOR_LOG_INFO("deadline risks evaluated",
                     {observability::IntField("orders", static_cast<std::int64_t>(risks.size())), observability::IntField("at_risk", at_risk)});
  return risks;
}

std::vector<OvertimeProjection> CapacityAnalyzer::GetOvertimeProjections(const AnalysisOptions& options) {
  observability::SpanScope span("CapacityAnalyzer.GetOvertimeProjections");
  const auto view = Load(options);

  std::map<util::Date, double> required;
  for (const auto& [order_id, entries] : view.open_schedules) {
    for (const auto& entry : entries) {
      if (IsOpenEntry(entry) && entry.date >= view.as_of) required[entry.date] += EntryLaborHours(*calendar_, entry);
    }
  }

  std::vector<OvertimeProjection> projections;
  for (const auto& [date, hours] : required) {
    OvertimeProjection projection;
    projection.date           = date;
    projection.required_hours = hours;

    const double overtime_per_worker = static_cast<double>(calendar_->OvertimeSeconds(date)) / 3600.0;
    for (const auto& member : view.pool) {
      const auto standard = view.WorkerHours(*calendar_, member, date);
      projection.standard_hours += standard;
      if (standard > 0.0) projection.overtime_capacity_hours += overtime_per_worker;
    }
    projection.overtime_hours            = std::max(0.0, projection.required_hours - projection.standard_hours);
    projection.exceeds_overtime_capacity = projection.overtime_hours > projection.overtime_capacity_hours + kEpsilonHours;
    projections.push_back(projection);
  }
  return projections;
}

CapacityAnalysis CapacityAnalyzer::GetCapacityAnalysis(std::int32_t weeks, const AnalysisOptions& options) {
  if (weeks < 1 || weeks > kMaxCapacityWeeks) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument, "weeks must be in 1..104, got " + std::to_string(weeks));
  }
  observability::SpanScope span("CapacityAnalyzer.GetCapacityAnalysis");
  return Capacity(Load(options), weeks);
}

ScenarioAnalysis CapacityAnalyzer::AnalyzeScenario(const AnalysisOptions& options, std::int32_t weeks) {
  if (weeks < 1 || weeks > kMaxCapacityWeeks) {
    throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument, "weeks must be in 1..104, got " + std::to_string(weeks));
  }
  observability::SpanScope span("CapacityAnalyzer.AnalyzeScenario");

  const auto       view = Load(options);
  ScenarioAnalysis scenario;
  scenario.risks    = Risks(view);
  scenario.capacity = Capacity(view, weeks);

  SHOPFLOOR_LOG_INFO("scenario analyzed", {observability::IntField("overrides", static_cast<std::int64_t>(options.overrides.size())),
                                           observability::IntField("active_workers", scenario.capacity.active_workers),
                                           observability::DoubleField("utilization_percent", scenario.capacity.utilization_percent)});
  return scenario;
}

} // namespace shopfloor::analysis
