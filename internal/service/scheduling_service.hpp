#pragma once

#include "shopfloor/scheduler/v1/scheduling_service.pb.h"
#include "service_context.hpp"

namespace shopfloor::service {

class SchedulingService {
public:
  explicit SchedulingService(ServiceContext ctx);

  shopfloor::scheduler::v1::GenerateScheduleResponse
  GenerateSchedule(const shopfloor::scheduler::v1::GenerateScheduleRequest& req);

  shopfloor::scheduler::v1::ReplanResponse
  Replan(const shopfloor::scheduler::v1::ReplanRequest& req);

  shopfloor::scheduler::v1::GetScheduleResponse
  GetSchedule(const shopfloor::scheduler::v1::GetScheduleRequest& req);

  shopfloor::scheduler::v1::GetDeadlineRisksResponse
  GetDeadlineRisks(const shopfloor::scheduler::v1::GetDeadlineRisksRequest& req);

  shopfloor::scheduler::v1::GetOvertimeProjectionsResponse
  GetOvertimeProjections(const shopfloor::scheduler::v1::GetOvertimeProjectionsRequest& req);

  shopfloor::scheduler::v1::GetCapacityAnalysisResponse
  GetCapacityAnalysis(const shopfloor::scheduler::v1::GetCapacityAnalysisRequest& req);

  shopfloor::scheduler::v1::AnalyzeScenarioResponse
  AnalyzeScenario(const shopfloor::scheduler::v1::AnalyzeScenarioRequest& req);

  shopfloor::scheduler::v1::RecordStartResponse
  RecordStart(const shopfloor::scheduler::v1::RecordStartRequest& req);

  shopfloor::scheduler::v1::RecordCompletionResponse
  RecordCompletion(const shopfloor::scheduler::v1::RecordCompletionRequest& req);

  shopfloor::scheduler::v1::SetProficiencyResponse
  SetProficiency(const shopfloor::scheduler::v1::SetProficiencyRequest& req);

  shopfloor::scheduler::v1::GetWorkerProductivityResponse
  GetWorkerProductivity(const shopfloor::scheduler::v1::GetWorkerProductivityRequest& req);

  shopfloor::scheduler::v1::GetProficiencyHistoryResponse
  GetProficiencyHistory(const shopfloor::scheduler::v1::GetProficiencyHistoryRequest& req);

  shopfloor::scheduler::v1::GetAssignmentAnalyticsResponse
  GetAssignmentAnalytics(const shopfloor::scheduler::v1::GetAssignmentAnalyticsRequest& req);

private:
  ServiceContext ctx_;
};

}
