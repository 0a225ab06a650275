#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

#include "internal/calendar/shift_calendar.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/feedback/efficiency_feedback.hpp"
#include "internal/model/order.hpp"
#include "internal/model/step.hpp"
#include "internal/scheduling/scheduling_options.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::analysis {

constexpr std::int32_t kDefaultCapacityWeeks = 8;
constexpr std::int32_t kMaxCapacityWeeks     = 104;

// What-if change to one active worker.
struct WorkerOverride {
  std::uint64_t         worker_id = 0;
  bool                  available = true;
  std::optional<double> hours_per_day;
};

struct AnalysisOptions {
  // Defaults to today.
  std::optional<util::Date>   as_of;
  std::vector<WorkerOverride> overrides;
};

struct SkillCapacity {
  model::SkillCategory skill            = model::SkillCategory::kOther;
  double               required_hours   = 0.0;
  double               available_hours  = 0.0;
  std::int32_t         eligible_workers = 0;
};

struct DeadlineRisk {
  std::uint64_t      order_id   = 0;
  std::uint64_t      product_id = 0;
  util::Date         due_date{};
  std::int32_t       days_until_due = 0;
  std::int64_t       quantity       = 0;
  model::OrderStatus status         = model::OrderStatus::kPending;

  double required_hours  = 0.0;
  double available_hours = 0.0;
  bool   can_meet        = true;
  double shortfall_hours = 0.0;

  std::vector<SkillCapacity> skills;
};

struct OvertimeProjection {
  util::Date date{};
  double     required_hours          = 0.0;
  double     standard_hours          = 0.0;
  double     overtime_hours          = 0.0;
  double     overtime_capacity_hours = 0.0;
  bool       exceeds_overtime_capacity = false;
};

struct WeeklyCapacity {
  util::Date week_start{};
  double     available_hours     = 0.0;
  double     required_hours      = 0.0;
  double     utilization_percent = 0.0;
};

struct CapacityAnalysis {
  std::int32_t weeks          = 0;
  std::int32_t active_workers = 0;

  double total_available_hours      = 0.0;
  double total_required_hours       = 0.0;
  double unscheduled_required_hours = 0.0;
  double utilization_percent        = 0.0;

  std::vector<WeeklyCapacity> weekly;
};

struct ScenarioAnalysis {
  std::vector<DeadlineRisk> risks;
  CapacityAnalysis          capacity;
};

// required / available x 100; 0 when both are 0, +inf when only available is.
double UtilizationPercent(double required_hours, double available_hours);

/*
  Read-only analyses over all open orders.

  Each call reads one repository snapshot inside a single transaction and
  never writes. Worker overrides only reshape the pool for that call.
*/
class CapacityAnalyzer {
 public:
  using NowFn = std::function<util::TimePoint()>;

  CapacityAnalyzer(std::shared_ptr<db::Repository> repository, std::shared_ptr<const calendar::ShiftCalendar> calendar,
                   scheduling::SchedulingOptions scheduling, feedback::FeedbackOptions feedback, NowFn now = util::Now);

  // Ranked by days until due, then order id.
  std::vector<DeadlineRisk> GetDeadlineRisks(const AnalysisOptions& options = {});

  std::vector<OvertimeProjection> GetOvertimeProjections(const AnalysisOptions& options = {});

  // Throws ValidationError(kInvalidArgument) unless 1 <= weeks <= 104.
  CapacityAnalysis GetCapacityAnalysis(std::int32_t weeks = kDefaultCapacityWeeks, const AnalysisOptions& options = {});

  ScenarioAnalysis AnalyzeScenario(const AnalysisOptions& options, std::int32_t weeks = kDefaultCapacityWeeks);

 private:
  struct View;

  View       Load(const AnalysisOptions& options);
  util::Date AsOf(const AnalysisOptions& options) const;

  std::vector<DeadlineRisk> Risks(const View& view) const;
  CapacityAnalysis          Capacity(const View& view, std::int32_t weeks) const;

  std::shared_ptr<db::Repository>                repository_;
  std::shared_ptr<const calendar::ShiftCalendar> calendar_;
  scheduling::SchedulingOptions                  scheduling_;
  feedback::FeedbackOptions                      feedback_;
  NowFn                                          now_;
};

} // namespace shopfloor::analysis
