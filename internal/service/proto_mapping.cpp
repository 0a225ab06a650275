#include "proto_mapping.hpp"

#include "internal/util/errors.hpp"

namespace shopfloor::service {

namespace v1 = shopfloor::scheduler::v1;

namespace {

template <typename ProtoEnum, typename ModelEnum>
ProtoEnum ToProtoEnum(ModelEnum value) {
  return static_cast<ProtoEnum>(static_cast<int>(value));
}

} // namespace

void ToProto(const model::ScheduleEntry& entry, v1::ScheduleEntry* out) {
  out->set_id(entry.id);
  out->set_schedule_id(entry.schedule_id);
  out->set_order_id(entry.order_id);
  out->set_step_id(entry.step_id);
  out->set_date(util::FormatDate(entry.date));
  out->set_start_time(util::FormatTimeOfDay(entry.start_second));
  out->set_end_time(util::FormatTimeOfDay(entry.end_second));
  out->set_planned_output(entry.planned_output);
  for (const auto& assignment : entry.assignments) {
    auto* a = out->add_assignments();
    a->set_worker_id(assignment.worker_id);
    a->set_planned_output(assignment.planned_output);
  }
  out->set_status(ToProtoEnum<v1::EntryStatus>(entry.status));
  if (entry.actual_start_second) out->set_actual_start_time(util::FormatTimeOfDay(*entry.actual_start_second));
  if (entry.actual_end_second) out->set_actual_end_time(util::FormatTimeOfDay(*entry.actual_end_second));
  if (entry.actual_output) out->set_actual_output(*entry.actual_output);
}

void ToProto(const model::Schedule& schedule, v1::Schedule* out) {
  out->set_id(schedule.id);
  out->set_order_id(schedule.order_id);
  out->set_start_date(util::FormatDate(schedule.start_date));
  out->set_generated_at_ms(schedule.generated_at_ms);
  for (const auto& entry : schedule.entries) ToProto(entry, out->add_entries());
}

void ToProto(const model::ScheduleWarning& warning, v1::ScheduleWarning* out) {
  out->set_kind(ToProtoEnum<v1::WarningKind>(warning.kind));
  out->set_order_id(warning.order_id);
  out->set_step_id(warning.step_id);
  if (warning.date) out->set_date(util::FormatDate(*warning.date));
  out->set_message(warning.message);
}

void ToProto(const model::ProficiencyHistory& change, v1::ProficiencyChange* out) {
  out->set_id(change.id);
  out->set_worker_id(change.worker_id);
  out->set_step_id(change.step_id);
  out->set_old_level(change.old_level);
  out->set_new_level(change.new_level);
  out->set_reason(ToProtoEnum<v1::ProficiencyReason>(change.reason));
  if (change.average_efficiency) out->set_average_efficiency(*change.average_efficiency);
  out->set_sample_size(change.sample_size);
  out->set_recorded_at_ms(change.recorded_at_ms);
}

void ToProto(const scheduling::Feasibility& feasibility, v1::Feasibility* out) {
  out->set_can_meet_deadline(feasibility.can_meet_deadline);
  out->set_completed_output(feasibility.completed_output);
  out->set_remaining_output(feasibility.remaining_output);
  out->set_regular_hours_needed(feasibility.regular_hours_needed);
  out->set_overtime_hours_needed(feasibility.overtime_hours_needed);
  for (const auto& block : feasibility.overtime_suggestions) {
    auto* s = out->add_overtime_suggestions();
    s->set_date(util::FormatDate(block.date));
    s->set_start_time(util::FormatTimeOfDay(block.start_second));
    s->set_end_time(util::FormatTimeOfDay(block.end_second));
    s->set_step_id(block.step_id);
    s->set_planned_output(block.planned_output);
    if (block.worker_id) s->set_worker_id(*block.worker_id);
  }
}

void ToProto(const feedback::AssignmentAnalytics& analytics, v1::AssignmentAnalytics* out) {
  out->set_worker_id(analytics.worker_id);
  out->set_planned_output(analytics.planned_output);
  out->set_actual_output(analytics.actual_output);
  out->set_expected_minutes(analytics.expected_minutes);
  out->set_actual_minutes(analytics.actual_minutes);
  if (analytics.efficiency_percent) out->set_efficiency_percent(*analytics.efficiency_percent);
}

void ToProto(const feedback::WorkerProductivity& productivity, v1::WorkerProductivity* out) {
  out->set_worker_id(productivity.worker_id);
  out->set_name(productivity.name);
  out->set_completed_entries(productivity.completed_entries);
  out->set_total_units(productivity.total_units);
  out->set_total_hours(productivity.total_hours);
  if (productivity.average_efficiency) out->set_average_efficiency(*productivity.average_efficiency);
  for (const auto& step : productivity.steps) {
    auto* s = out->add_steps();
    s->set_step_id(step.step_id);
    s->set_step_name(step.step_name);
    s->set_completed_entries(step.completed_entries);
    s->set_units(step.units);
    s->set_hours(step.hours);
    if (step.average_efficiency) s->set_average_efficiency(*step.average_efficiency);
    s->set_proficiency_level(step.proficiency_level);
  }
}

void ToProto(const analysis::DeadlineRisk& risk, v1::DeadlineRisk* out) {
  out->set_order_id(risk.order_id);
  out->set_product_id(risk.product_id);
  out->set_due_date(util::FormatDate(risk.due_date));
  out->set_days_until_due(risk.days_until_due);
  out->set_quantity(risk.quantity);
  out->set_status(ToProtoEnum<v1::OrderStatus>(risk.status));
  out->set_required_hours(risk.required_hours);
  out->set_available_hours(risk.available_hours);
  out->set_can_meet(risk.can_meet);
  out->set_shortfall_hours(risk.shortfall_hours);
  for (const auto& skill : risk.skills) {
    auto* s = out->add_skills();
    s->set_skill(ToProtoEnum<v1::SkillCategory>(skill.skill));
    s->set_required_hours(skill.required_hours);
    s->set_available_hours(skill.available_hours);
    s->set_eligible_workers(skill.eligible_workers);
  }
}

void ToProto(const analysis::OvertimeProjection& projection, v1::OvertimeProjection* out) {
  out->set_date(util::FormatDate(projection.date));
  out->set_required_hours(projection.required_hours);
  out->set_standard_hours(projection.standard_hours);
  out->set_overtime_hours(projection.overtime_hours);
  out->set_overtime_capacity_hours(projection.overtime_capacity_hours);
  out->set_exceeds_overtime_capacity(projection.exceeds_overtime_capacity);
}

void ToProto(const analysis::CapacityAnalysis& capacity, v1::CapacityAnalysis* out) {
  out->set_weeks(capacity.weeks);
  out->set_active_workers(capacity.active_workers);
  out->set_total_available_hours(capacity.total_available_hours);
  out->set_total_required_hours(capacity.total_required_hours);
  out->set_unscheduled_required_hours(capacity.unscheduled_required_hours);
  out->set_utilization_percent(capacity.utilization_percent);
  for (const auto& week : capacity.weekly) {
    auto* w = out->add_weekly();
    w->set_week_start(util::FormatDate(week.week_start));
    w->set_available_hours(week.available_hours);
    w->set_required_hours(week.required_hours);
    w->set_utilization_percent(week.utilization_percent);
  }
}

analysis::WorkerOverride FromProto(const v1::WorkerOverride& override_msg) {
  analysis::WorkerOverride result;
  result.worker_id = override_msg.worker_id();
  result.available = override_msg.available();
  if (override_msg.has_hours_per_day()) {
    if (override_msg.hours_per_day() < 0.0 || override_msg.hours_per_day() > 24.0) {
      throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument, "hours_per_day must be within 0..24");
    }
    result.hours_per_day = override_msg.hours_per_day();
  }
  return result;
}

scheduling::ReplanConstraints FromProto(const v1::ReplanConstraints& constraints) {
  scheduling::ReplanConstraints result;
  result.discard_actuals = constraints.discard_actuals();
  result.excluded_workers.insert(constraints.excluded_worker_ids().begin(), constraints.excluded_worker_ids().end());
  if (constraints.max_crew_size() > 0) result.max_crew_size = constraints.max_crew_size();
  return result;
}

std::optional<util::Date> OptionalDate(const std::string& text) {
  if (text.empty()) return std::nullopt;
  return util::ParseDate(text);
}

std::optional<std::int32_t> OptionalTimeOfDay(const std::string& text) {
  if (text.empty()) return std::nullopt;
  return util::ParseTimeOfDay(text);
}

std::optional<calendar::SlotTime> OptionalStart(const std::string& date, const std::string& time) {
  auto day = OptionalDate(date);
  auto at  = OptionalTimeOfDay(time);
  if (!day) {
    if (at) {
      throw util::ValidationError(util::ValidationErrorKind::kInvalidArgument, "a start time needs a start date");
    }
    return std::nullopt;
  }
  return calendar::SlotTime{*day, at.value_or(0)};
}

std::optional<util::Deadline> OptionalDeadline(std::uint32_t timeout_ms) {
  if (timeout_ms == 0) return std::nullopt;
  return util::Deadline::After(std::chrono::milliseconds(timeout_ms));
}

} // namespace shopfloor::service
