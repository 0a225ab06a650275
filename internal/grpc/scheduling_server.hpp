#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "shopfloor/scheduler/v1/scheduling_service.grpc.pb.h"
#include "internal/service/scheduling_service.hpp"

namespace shopfloor::grpc {

class SchedulingServer final : public shopfloor::scheduler::v1::SchedulingService::Service {
public:
  explicit SchedulingServer(std::shared_ptr<shopfloor::service::SchedulingService> svc);

  ::grpc::Status GenerateSchedule(::grpc::ServerContext* ctx,
                                  const shopfloor::scheduler::v1::GenerateScheduleRequest* req,
                                  shopfloor::scheduler::v1::GenerateScheduleResponse* resp) override;

  ::grpc::Status Replan(::grpc::ServerContext* ctx,
                        const shopfloor::scheduler::v1::ReplanRequest* req,
                        shopfloor::scheduler::v1::ReplanResponse* resp) override;

  ::grpc::Status GetSchedule(::grpc::ServerContext* ctx,
                             const shopfloor::scheduler::v1::GetScheduleRequest* req,
                             shopfloor::scheduler::v1::GetScheduleResponse* resp) override;

  ::grpc::Status GetDeadlineRisks(::grpc::ServerContext* ctx,
                                  const shopfloor::scheduler::v1::GetDeadlineRisksRequest* req,
                                  shopfloor::scheduler::v1::GetDeadlineRisksResponse* resp) override;

  ::grpc::Status GetOvertimeProjections(::grpc::ServerContext* ctx,
                                        const shopfloor::scheduler::v1::GetOvertimeProjectionsRequest* req,
                                        shopfloor::scheduler::v1::GetOvertimeProjectionsResponse* resp) override;

  ::grpc::Status GetCapacityAnalysis(::grpc::ServerContext* ctx,
                                     const shopfloor::scheduler::v1::GetCapacityAnalysisRequest* req,
                                     shopfloor::scheduler::v1::GetCapacityAnalysisResponse* resp) override;

  ::grpc::Status AnalyzeScenario(::grpc::ServerContext* ctx,
                                 const shopfloor::scheduler::v1::AnalyzeScenarioRequest* req,
                                 shopfloor::scheduler::v1::AnalyzeScenarioResponse* resp) override;

  ::grpc::Status RecordStart(::grpc::ServerContext* ctx,
                             const shopfloor::scheduler::v1::RecordStartRequest* req,
                             shopfloor::scheduler::v1::RecordStartResponse* resp) override;

  ::grpc::Status RecordCompletion(::grpc::ServerContext* ctx,
                                  const shopfloor::scheduler::v1::RecordCompletionRequest* req,
                                  shopfloor::scheduler::v1::RecordCompletionResponse* resp) override;

  ::grpc::Status SetProficiency(::grpc::ServerContext* ctx,
                                const shopfloor::scheduler::v1::SetProficiencyRequest* req,
                                shopfloor::scheduler::v1::SetProficiencyResponse* resp) override;

  ::grpc::Status GetWorkerProductivity(::grpc::ServerContext* ctx,
                                       const shopfloor::scheduler::v1::GetWorkerProductivityRequest* req,
                                       shopfloor::scheduler::v1::GetWorkerProductivityResponse* resp) override;

  ::grpc::Status GetProficiencyHistory(::grpc::ServerContext* ctx,
                                       const shopfloor::scheduler::v1::GetProficiencyHistoryRequest* req,
                                       shopfloor::scheduler::v1::GetProficiencyHistoryResponse* resp) override;

  ::grpc::Status GetAssignmentAnalytics(::grpc::ServerContext* ctx,
                                        const shopfloor::scheduler::v1::GetAssignmentAnalyticsRequest* req,
                                        shopfloor::scheduler::v1::GetAssignmentAnalyticsResponse* resp) override;

private:
  std::shared_ptr<shopfloor::service::SchedulingService> service_;
};

}
