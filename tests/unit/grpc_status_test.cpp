#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/scheduling_server.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"
#include "shopfloor/scheduler/v1.hpp"

namespace {

namespace v1 = shopfloor::scheduler::v1;

using shopfloor::db::ThrowIfDbError;
using shopfloor::util::ParseDate;

struct Harness {
  std::shared_ptr<shopfloor::db::memory::MemoryRepository> repository = std::make_shared<shopfloor::db::memory::MemoryRepository>();
  shopfloor::factory::Application                          app        = shopfloor::factory::Build(shopfloor::runtime::config::RuntimeConfig{}, repository);
  shopfloor::grpc::SchedulingServer                        server{app.scheduling_service};

  std::uint64_t order_id  = 0;
  std::uint64_t step_id   = 0;
  std::uint64_t worker_id = 0;
};

// One-step product with a single qualified worker and a pending order of 50.
void Seed(Harness& h) {
  auto tx = h.repository->Begin();

  shopfloor::model::Step step;
  step.product_id             = 1;
  step.name                   = "press";
  step.sequence               = 1;
  step.required_skill         = shopfloor::model::SkillCategory::kOther;
  step.time_per_piece_seconds = 30;
  ThrowIfDbError(h.repository->InsertStep(*tx, step), "insert step");

  shopfloor::model::Worker worker{0, "presser", shopfloor::model::WorkerStatus::kActive, shopfloor::model::SkillCategory::kOther};
  ThrowIfDbError(h.repository->InsertWorker(*tx, worker), "insert worker");

  shopfloor::model::Order order{0, 1, 50, ParseDate("2026-03-13"), shopfloor::model::OrderStatus::kPending};
  ThrowIfDbError(h.repository->InsertOrder(*tx, order), "insert order");
  tx->Commit();

  h.order_id  = order.id;
  h.step_id   = step.id;
  h.worker_id = worker.id;
}

void TestExceptionMapping() {
  using ::grpc::StatusCode;
  using namespace shopfloor::util;

  assert(shopfloor::grpc::ToStatus(NotFound("order 1")).error_code() == StatusCode::NOT_FOUND);
  assert(shopfloor::grpc::ToStatus(ValidationError(ValidationErrorKind::kInvalidQuantity, "q")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(shopfloor::grpc::ToStatus(GraphError(GraphErrorKind::kCycle, "c")).error_code() == StatusCode::INVALID_ARGUMENT);
  assert(shopfloor::grpc::ToStatus(ConcurrencyConflict("busy")).error_code() == StatusCode::ABORTED);
  assert(shopfloor::grpc::ToStatus(DeadlineExceeded("late")).error_code() == StatusCode::DEADLINE_EXCEEDED);
  assert(shopfloor::grpc::ToStatus(TransactionConflict("moved")).error_code() == StatusCode::UNAVAILABLE);
  assert(shopfloor::grpc::ToStatus(PersistenceFailure("disk")).error_code() == StatusCode::UNAVAILABLE);
  assert(shopfloor::grpc::ToStatus(std::runtime_error("boom")).error_code() == StatusCode::INTERNAL);

  const auto status = shopfloor::grpc::ToStatus(NotFound("schedule 42"));
  assert(status.error_message().find("schedule 42") != std::string::npos);
  assert(status.error_details() == "not_found");

  assert(shopfloor::grpc::ToStatus(GraphError(GraphErrorKind::kCycle, "c")).error_details() == "graph.cycle");
  assert(shopfloor::grpc::ErrorTag(ValidationError(ValidationErrorKind::kUnknownId, "w")) == "validation.unknown_id");
  assert(shopfloor::grpc::ErrorTag(TransactionConflict("moved")) == "persistence.conflict");
}

void TestMissingScheduleReturnsNotFound() {
  Harness h;

  v1::GetScheduleRequest req;
  req.set_schedule_id(404);
  v1::GetScheduleResponse resp;
  ::grpc::ServerContext   ctx;

  assert(h.server.GetSchedule(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestGenerateThenFetch() {
  Harness h;
  Seed(h);

  v1::GenerateScheduleRequest req;
  req.set_order_id(h.order_id);
  req.set_start_date("2026-03-02");
  req.set_start_time("07:00");
  v1::GenerateScheduleResponse resp;
  ::grpc::ServerContext        ctx;

  const auto status = h.server.GenerateSchedule(&ctx, &req, &resp);
  assert(status.ok());
  assert(resp.schedule().order_id() == h.order_id);
  assert(resp.schedule().start_date() == "2026-03-02");
  assert(resp.schedule().entries_size() == 1);
  const auto& entry = resp.schedule().entries(0);
  assert(entry.start_time() == "07:00:00");
  assert(entry.end_time() == "07:25:00");
  assert(entry.planned_output() == 50);
  assert(entry.status() == v1::ENTRY_STATUS_NOT_STARTED);
  assert(entry.assignments_size() == 1);
  assert(entry.assignments(0).worker_id() == h.worker_id);
  assert(!entry.has_actual_end_time());

  assert(resp.has_feasibility());
  assert(resp.feasibility().can_meet_deadline());
  assert(resp.feasibility().completed_output() == 0);
  assert(resp.feasibility().remaining_output() == 50);
  assert(std::abs(resp.feasibility().regular_hours_needed() - 1500.0 / 3600.0) < 1e-9);
  assert(resp.feasibility().overtime_suggestions_size() == 0);

  v1::GetScheduleRequest fetch;
  fetch.set_schedule_id(resp.schedule().id());
  v1::GetScheduleResponse fetched;
  ::grpc::ServerContext   fetch_ctx;
  assert(h.server.GetSchedule(&fetch_ctx, &fetch, &fetched).ok());
  assert(fetched.schedule().entries_size() == 1);
  assert(fetched.schedule().entries(0).id() == entry.id());
}

void TestMalformedStartIsInvalidArgument() {
  Harness h;
  Seed(h);

  v1::GenerateScheduleRequest time_only;
  time_only.set_order_id(h.order_id);
  time_only.set_start_time("07:00");
  v1::GenerateScheduleResponse resp;
  ::grpc::ServerContext        ctx;
  assert(h.server.GenerateSchedule(&ctx, &time_only, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::GenerateScheduleRequest bad_date;
  bad_date.set_order_id(h.order_id);
  bad_date.set_start_date("2026-13-40");
  ::grpc::ServerContext ctx2;
  assert(h.server.GenerateSchedule(&ctx2, &bad_date, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::GenerateScheduleRequest unknown;
  unknown.set_order_id(9999);
  ::grpc::ServerContext ctx3;
  assert(h.server.GenerateSchedule(&ctx3, &unknown, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCyclicProductIsInvalidArgument() {
  Harness h;
  {
    auto tx = h.repository->Begin();

    shopfloor::model::Step a;
    a.id           = 101;
    a.product_id   = 2;
    a.name         = "a";
    a.sequence     = 1;
    a.dependencies = {102};
    ThrowIfDbError(h.repository->InsertStep(*tx, a), "insert step");

    shopfloor::model::Step b = a;
    b.id                     = 102;
    b.name                   = "b";
    b.sequence               = 2;
    b.dependencies           = {101};
    ThrowIfDbError(h.repository->InsertStep(*tx, b), "insert step");

    shopfloor::model::Order order{0, 2, 5, ParseDate("2026-03-13"), shopfloor::model::OrderStatus::kPending};
    ThrowIfDbError(h.repository->InsertOrder(*tx, order), "insert order");
    tx->Commit();
    h.order_id = order.id;
  }

  v1::GenerateScheduleRequest req;
  req.set_order_id(h.order_id);
  req.set_start_date("2026-03-02");
  v1::GenerateScheduleResponse resp;
  ::grpc::ServerContext        ctx;
  const auto                   status = h.server.GenerateSchedule(&ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(status.error_message().find("101") != std::string::npos);
}

void TestCapacityWeeksBounds() {
  Harness h;
  Seed(h);

  v1::GetCapacityAnalysisRequest req;
  req.set_weeks(200);
  req.set_as_of("2026-03-02");
  v1::GetCapacityAnalysisResponse resp;
  ::grpc::ServerContext           ctx;
  assert(h.server.GetCapacityAnalysis(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  req.set_weeks(0);
  ::grpc::ServerContext ctx2;
  assert(h.server.GetCapacityAnalysis(&ctx2, &req, &resp).ok());
  assert(resp.analysis().weeks() == 8);
  assert(resp.analysis().weekly_size() == 8);
  assert(resp.analysis().weekly(0).week_start() == "2026-03-02");
  assert(resp.analysis().active_workers() == 1);
}

void TestScenarioOverrideValidation() {
  Harness h;
  Seed(h);

  v1::AnalyzeScenarioRequest req;
  req.set_as_of("2026-03-02");
  auto* override_msg = req.add_overrides();
  override_msg->set_worker_id(h.worker_id);
  override_msg->set_available(true);
  override_msg->set_hours_per_day(30.0);
  v1::AnalyzeScenarioResponse resp;
  ::grpc::ServerContext       ctx;
  assert(h.server.AnalyzeScenario(&ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  override_msg->set_available(false);
  override_msg->clear_hours_per_day();
  ::grpc::ServerContext ctx2;
  assert(h.server.AnalyzeScenario(&ctx2, &req, &resp).ok());
  assert(resp.risks_size() == 1);
  assert(!resp.risks(0).can_meet());
  assert(resp.capacity().active_workers() == 0);
}

void TestProficiencyAndActuals() {
  Harness h;
  Seed(h);

  v1::SetProficiencyRequest bad_level;
  bad_level.set_worker_id(h.worker_id);
  bad_level.set_step_id(h.step_id);
  bad_level.set_level(9);
  v1::SetProficiencyResponse prof_resp;
  ::grpc::ServerContext      ctx;
  assert(h.server.SetProficiency(&ctx, &bad_level, &prof_resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::SetProficiencyRequest unknown_worker = bad_level;
  unknown_worker.set_worker_id(9999);
  unknown_worker.set_level(4);
  ::grpc::ServerContext ctx2;
  assert(h.server.SetProficiency(&ctx2, &unknown_worker, &prof_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::SetProficiencyRequest raise = bad_level;
  raise.set_level(4);
  ::grpc::ServerContext ctx3;
  assert(h.server.SetProficiency(&ctx3, &raise, &prof_resp).ok());
  assert(prof_resp.has_change());
  assert(prof_resp.change().old_level() == 3);
  assert(prof_resp.change().new_level() == 4);
  assert(prof_resp.change().reason() == v1::PROFICIENCY_REASON_MANUAL);

  v1::SetProficiencyResponse unchanged;
  ::grpc::ServerContext      ctx4;
  assert(h.server.SetProficiency(&ctx4, &raise, &unchanged).ok());
  assert(!unchanged.has_change());

  v1::GetProficiencyHistoryRequest history_req;
  history_req.set_worker_id(h.worker_id);
  v1::GetProficiencyHistoryResponse history;
  ::grpc::ServerContext             history_ctx;
  assert(h.server.GetProficiencyHistory(&history_ctx, &history_req, &history).ok());
  assert(history.changes_size() == 1);
  assert(history.changes(0).step_id() == h.step_id);
  assert(history.changes(0).new_level() == 4);

  history_req.set_step_id(9999);
  ::grpc::ServerContext history_ctx2;
  assert(h.server.GetProficiencyHistory(&history_ctx2, &history_req, &history).error_code() == ::grpc::StatusCode::NOT_FOUND);

  history_req.set_worker_id(9999);
  history_req.set_step_id(0);
  ::grpc::ServerContext history_ctx3;
  assert(h.server.GetProficiencyHistory(&history_ctx3, &history_req, &history).error_code() == ::grpc::StatusCode::NOT_FOUND);

  v1::RecordCompletionRequest no_end;
  no_end.set_entry_id(1);
  no_end.set_actual_output(10);
  v1::RecordCompletionResponse completion;
  ::grpc::ServerContext        ctx5;
  assert(h.server.RecordCompletion(&ctx5, &no_end, &completion).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  v1::RecordStartRequest missing_entry;
  missing_entry.set_entry_id(777);
  v1::RecordStartResponse started;
  ::grpc::ServerContext   ctx6;
  assert(h.server.RecordStart(&ctx6, &missing_entry, &started).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestServerOptionsFromConfig() {
  const auto defaults = shopfloor::runtime::ServerOptionsFromConfig({});
  assert(defaults.bind_address == "0.0.0.0:50061");
  assert(defaults.shutdown_grace == std::chrono::milliseconds(5000));

  shopfloor::runtime::config::ServerConfig config;
  config.set_bind_address("127.0.0.1:7000");
  config.set_shutdown_grace_ms(250);
  config.set_max_receive_message_bytes(1024);
  const auto options = shopfloor::runtime::ServerOptionsFromConfig(config);
  assert(options.bind_address == "127.0.0.1:7000");
  assert(options.shutdown_grace == std::chrono::milliseconds(250));
  assert(options.max_receive_message_bytes == 1024);
}

} // namespace

int main() {
  TestExceptionMapping();
  TestMissingScheduleReturnsNotFound();
  TestGenerateThenFetch();
  TestMalformedStartIsInvalidArgument();
  TestCyclicProductIsInvalidArgument();
  TestCapacityWeeksBounds();
  TestScenarioOverrideValidation();
  TestProficiencyAndActuals();
  TestServerOptionsFromConfig();

  std::cout << "shopfloor_unit_grpc_status: pass\n";
  return 0;
}
