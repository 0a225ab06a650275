#pragma once

#include <optional>
#include <string>

#include "shopfloor/scheduler/v1.hpp"

#include "internal/analysis/capacity_analyzer.hpp"
#include "internal/calendar/shift_calendar.hpp"
#include "internal/feedback/efficiency_feedback.hpp"
#include "internal/model/schedule.hpp"
#include "internal/model/worker.hpp"
#include "internal/scheduling/schedule_generator.hpp"
#include "internal/util/time.hpp"

namespace shopfloor::service {

/*
  Conversions between engine types and the v1 wire messages.

  Wire dates are "YYYY-MM-DD" and times "HH:MM:SS"; an empty string means
  "not given". Malformed values throw ValidationError.
*/

void ToProto(const model::ScheduleEntry& entry, shopfloor::scheduler::v1::ScheduleEntry* out);
void ToProto(const model::Schedule& schedule, shopfloor::scheduler::v1::Schedule* out);
void ToProto(const model::ScheduleWarning& warning, shopfloor::scheduler::v1::ScheduleWarning* out);
void ToProto(const model::ProficiencyHistory& change, shopfloor::scheduler::v1::ProficiencyChange* out);
void ToProto(const scheduling::Feasibility& feasibility, shopfloor::scheduler::v1::Feasibility* out);

void ToProto(const feedback::AssignmentAnalytics& analytics, shopfloor::scheduler::v1::AssignmentAnalytics* out);
void ToProto(const feedback::WorkerProductivity& productivity, shopfloor::scheduler::v1::WorkerProductivity* out);

void ToProto(const analysis::DeadlineRisk& risk, shopfloor::scheduler::v1::DeadlineRisk* out);
void ToProto(const analysis::OvertimeProjection& projection, shopfloor::scheduler::v1::OvertimeProjection* out);
void ToProto(const analysis::CapacityAnalysis& capacity, shopfloor::scheduler::v1::CapacityAnalysis* out);

analysis::WorkerOverride          FromProto(const shopfloor::scheduler::v1::WorkerOverride& override_msg);
scheduling::ReplanConstraints     FromProto(const shopfloor::scheduler::v1::ReplanConstraints& constraints);

std::optional<util::Date>   OptionalDate(const std::string& text);
std::optional<std::int32_t> OptionalTimeOfDay(const std::string& text);

// Start instant from a date and an optional time; a time needs a date.
std::optional<calendar::SlotTime> OptionalStart(const std::string& date, const std::string& time);

std::optional<util::Deadline> OptionalDeadline(std::uint32_t timeout_ms);

} // namespace shopfloor::service
