#include "scheduling_server.hpp"

#include "grpc_error.hpp"
#include "shopfloor/scheduler/v1.hpp"

namespace shopfloor::grpc {

using namespace shopfloor::scheduler::v1;

SchedulingServer::SchedulingServer(std::shared_ptr<shopfloor::service::SchedulingService> svc) : service_(std::move(svc)) {
}

::grpc::Status SchedulingServer::GenerateSchedule(::grpc::ServerContext*, const GenerateScheduleRequest* req, GenerateScheduleResponse* resp) {
  try {
    *resp = service_->GenerateSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::Replan(::grpc::ServerContext*, const ReplanRequest* req, ReplanResponse* resp) {
  try {
    *resp = service_->Replan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::GetSchedule(::grpc::ServerContext*, const GetScheduleRequest* req, GetScheduleResponse* resp) {
  try {
    *resp = service_->GetSchedule(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::GetDeadlineRisks(::grpc::ServerContext*, const GetDeadlineRisksRequest* req, GetDeadlineRisksResponse* resp) {
  try {
    *resp = service_->GetDeadlineRisks(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::GetOvertimeProjections(::grpc::ServerContext*, const GetOvertimeProjectionsRequest* req, GetOvertimeProjectionsResponse* resp) {
  try {
    *resp = service_->GetOvertimeProjections(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::GetCapacityAnalysis(::grpc::ServerContext*, const GetCapacityAnalysisRequest* req, GetCapacityAnalysisResponse* resp) {
  try {
    *resp = service_->GetCapacityAnalysis(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::AnalyzeScenario(::grpc::ServerContext*, const AnalyzeScenarioRequest* req, AnalyzeScenarioResponse* resp) {
  try {
    *resp = service_->AnalyzeScenario(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::RecordStart(::grpc::ServerContext*, const RecordStartRequest* req, RecordStartResponse* resp) {
  try {
    *resp = service_->RecordStart(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::RecordCompletion(::grpc::ServerContext*, const RecordCompletionRequest* req, RecordCompletionResponse* resp) {
  try {
    *resp = service_->RecordCompletion(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::SetProficiency(::grpc::ServerContext*, const SetProficiencyRequest* req, SetProficiencyResponse* resp) {
  try {
    *resp = service_->SetProficiency(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::GetWorkerProductivity(::grpc::ServerContext*, const GetWorkerProductivityRequest* req, GetWorkerProductivityResponse* resp) {
  try {
    *resp = service_->GetWorkerProductivity(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::GetProficiencyHistory(::grpc::ServerContext*, const GetProficiencyHistoryRequest* req, GetProficiencyHistoryResponse* resp) {
  try {
    *resp = service_->GetProficiencyHistory(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SchedulingServer::GetAssignmentAnalytics(::grpc::ServerContext*, const GetAssignmentAnalyticsRequest* req, GetAssignmentAnalyticsResponse* resp) {
  try {
    *resp = service_->GetAssignmentAnalytics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace shopfloor::grpc
