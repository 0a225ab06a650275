#include "scheduling_service.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "internal/analysis/capacity_analyzer.hpp"
#include "internal/feedback/efficiency_feedback.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduling/schedule_generator.hpp"
#include "internal/util/errors.hpp"
#include "proto_mapping.hpp"
#include "shopfloor/scheduler/v1.hpp"

namespace shopfloor::service {

using namespace shopfloor::scheduler::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view id_key, std::uint64_t id, Fn&& fn) {
  shopfloor::observability::SpanScope span(route);
  if (!id_key.empty()) {
    span.SetAttribute(id_key, static_cast<std::int64_t>(id));
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    shopfloor::observability::Metrics::Instance().RecordRequest(route, success);
    shopfloor::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    auto result = fn();
    finish(true);
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    SHOPFLOOR_LOG_ERROR("RPC failed", {shopfloor::observability::StringField("route", route), shopfloor::observability::StringField("error", ex.what()),
                                       shopfloor::observability::IntField(id_key.empty() ? "id" : id_key, static_cast<std::int64_t>(id))});
    finish(false);
    throw;
  }
}

analysis::AnalysisOptions AnalysisFrom(const std::string& as_of) {
  analysis::AnalysisOptions options;
  options.as_of = OptionalDate(as_of);
  return options;
}

std::int32_t WeeksOrDefault(std::int32_t weeks) {
  return weeks == 0 ? analysis::kDefaultCapacityWeeks : weeks;
}

} // namespace

SchedulingService::SchedulingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GenerateScheduleResponse SchedulingService::GenerateSchedule(const GenerateScheduleRequest& req) {
  return ObserveRpc("SchedulingService.GenerateSchedule", "order.id", req.order_id(), [&] {
    auto result = ctx_.generator->Generate(req.order_id(), OptionalStart(req.start_date(), req.start_time()), OptionalDeadline(req.timeout_ms()));

    GenerateScheduleResponse resp;
    ToProto(result.schedule, resp.mutable_schedule());
    for (const auto& warning : result.warnings) ToProto(warning, resp.add_warnings());
    ToProto(result.feasibility, resp.mutable_feasibility());
    return resp;
  });
}

ReplanResponse SchedulingService::Replan(const ReplanRequest& req) {
  return ObserveRpc("SchedulingService.Replan", "schedule.id", req.schedule_id(), [&] {
    auto result = ctx_.generator->Replan(req.schedule_id(), OptionalStart(req.new_start_date(), req.new_start_time()), FromProto(req.constraints()),
                                         OptionalDeadline(req.timeout_ms()));

    ReplanResponse resp;
    ToProto(result.schedule, resp.mutable_schedule());
    for (const auto& warning : result.warnings) ToProto(warning, resp.add_warnings());
    ToProto(result.feasibility, resp.mutable_feasibility());
    return resp;
  });
}

GetScheduleResponse SchedulingService::GetSchedule(const GetScheduleRequest& req) {
  return ObserveRpc("SchedulingService.GetSchedule", "schedule.id", req.schedule_id(), [&] {
    GetScheduleResponse resp;
    ToProto(ctx_.generator->GetSchedule(req.schedule_id()), resp.mutable_schedule());
    return resp;
  });
}

GetDeadlineRisksResponse SchedulingService::GetDeadlineRisks(const GetDeadlineRisksRequest& req) {
  return ObserveRpc("SchedulingService.GetDeadlineRisks", "", 0, [&] {
    GetDeadlineRisksResponse resp;
    for (const auto& risk : ctx_.analyzer->GetDeadlineRisks(AnalysisFrom(req.as_of()))) ToProto(risk, resp.add_risks());
    return resp;
  });
}

GetOvertimeProjectionsResponse SchedulingService::GetOvertimeProjections(const GetOvertimeProjectionsRequest& req) {
  return ObserveRpc("SchedulingService.GetOvertimeProjections", "", 0, [&] {
    GetOvertimeProjectionsResponse resp;
    for (const auto& projection : ctx_.analyzer->GetOvertimeProjections(AnalysisFrom(req.as_of()))) ToProto(projection, resp.add_projections());
    return resp;
  });
}

GetCapacityAnalysisResponse SchedulingService::GetCapacityAnalysis(const GetCapacityAnalysisRequest& req) {
  return ObserveRpc("SchedulingService.GetCapacityAnalysis", "", 0, [&] {
    GetCapacityAnalysisResponse resp;
    ToProto(ctx_.analyzer->GetCapacityAnalysis(WeeksOrDefault(req.weeks()), AnalysisFrom(req.as_of())), resp.mutable_analysis());
    return resp;
  });
}

AnalyzeScenarioResponse SchedulingService::AnalyzeScenario(const AnalyzeScenarioRequest& req) {
  return ObserveRpc("SchedulingService.AnalyzeScenario", "", 0, [&] {
    auto options = AnalysisFrom(req.as_of());
    for (const auto& override_msg : req.overrides()) options.overrides.push_back(FromProto(override_msg));

    auto scenario = ctx_.analyzer->AnalyzeScenario(options, WeeksOrDefault(req.weeks()));

    AnalyzeScenarioResponse resp;
    for (const auto& risk : scenario.risks) ToProto(risk, resp.add_risks());
    ToProto(scenario.capacity, resp.mutable_capacity());
    return resp;
  });
}

RecordStartResponse SchedulingService::RecordStart(const RecordStartRequest& req) {
  return ObserveRpc("SchedulingService.RecordStart", "entry.id", req.entry_id(), [&] {
    RecordStartResponse resp;
    ToProto(ctx_.feedback->RecordStart(req.entry_id(), OptionalTimeOfDay(req.actual_start_time())), resp.mutable_entry());
    return resp;
  });
}

RecordCompletionResponse SchedulingService::RecordCompletion(const RecordCompletionRequest& req) {
  return ObserveRpc("SchedulingService.RecordCompletion", "entry.id", req.entry_id(), [&] {
    if (req.actual_end_time().empty()) {
      throw shopfloor::util::ValidationError(shopfloor::util::ValidationErrorKind::kInvalidActuals, "actual_end_time is required");
    }
    auto result = ctx_.feedback->RecordCompletion(req.entry_id(), req.actual_output(), shopfloor::util::ParseTimeOfDay(req.actual_end_time()));

    RecordCompletionResponse resp;
    ToProto(result.entry, resp.mutable_entry());
    for (const auto& change : result.proficiency_changes) ToProto(change, resp.add_proficiency_changes());
    for (const auto& analytics : result.assignments) ToProto(analytics, resp.add_assignments());
    return resp;
  });
}

SetProficiencyResponse SchedulingService::SetProficiency(const SetProficiencyRequest& req) {
  return ObserveRpc("SchedulingService.SetProficiency", "worker.id", req.worker_id(), [&] {
    SetProficiencyResponse resp;
    if (auto change = ctx_.feedback->SetProficiency(req.worker_id(), req.step_id(), req.level())) {
      ToProto(*change, resp.mutable_change());
    }
    return resp;
  });
}

GetWorkerProductivityResponse SchedulingService::GetWorkerProductivity(const GetWorkerProductivityRequest& req) {
  return ObserveRpc("SchedulingService.GetWorkerProductivity", "worker.id", req.worker_id(), [&] {
    GetWorkerProductivityResponse resp;
    ToProto(ctx_.feedback->GetWorkerProductivity(req.worker_id()), resp.mutable_productivity());
    return resp;
  });
}

GetProficiencyHistoryResponse SchedulingService::GetProficiencyHistory(const GetProficiencyHistoryRequest& req) {
  return ObserveRpc("SchedulingService.GetProficiencyHistory", "worker.id", req.worker_id(), [&] {
    std::optional<std::uint64_t> step_id;
    if (req.step_id() != 0) step_id = req.step_id();

    GetProficiencyHistoryResponse resp;
    for (const auto& change : ctx_.feedback->GetProficiencyHistory(req.worker_id(), step_id)) ToProto(change, resp.add_changes());
    return resp;
  });
}

GetAssignmentAnalyticsResponse SchedulingService::GetAssignmentAnalytics(const GetAssignmentAnalyticsRequest& req) {
  return ObserveRpc("SchedulingService.GetAssignmentAnalytics", "entry.id", req.entry_id(), [&] {
    GetAssignmentAnalyticsResponse resp;
    for (const auto& analytics : ctx_.feedback->GetAssignmentAnalytics(req.entry_id())) ToProto(analytics, resp.add_assignments());
    return resp;
  });
}

} // namespace shopfloor::service
