#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/analysis/capacity_analyzer.hpp"
#include "internal/calendar/shift_calendar.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/feedback/efficiency_feedback.hpp"
#include "internal/grpc/scheduling_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduling/order_locks.hpp"
#include "internal/scheduling/schedule_generator.hpp"
#if SHOPFLOOR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace shopfloor::factory {

namespace {

std::shared_ptr<db::Repository> BuildRepository(const shopfloor::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SHOPFLOOR_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::BootstrapSchema(*sqlite_db);
    SHOPFLOOR_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  SHOPFLOOR_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

Application Build(const shopfloor::runtime::config::RuntimeConfig& config) {
  return Build(config, BuildRepository(config));
}

Application Build(const shopfloor::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository) {
  Application app;

  // ------------------------------------------------------------------
  // Engine settings
  // ------------------------------------------------------------------
  auto shift_calendar     = std::make_shared<calendar::StandardShiftCalendar>(config::ShiftPatternFromConfig(config.shift_calendar()));
  auto scheduling_options = config::SchedulingOptionsFromConfig(config.scheduling());
  auto feedback_options   = config::FeedbackOptionsFromConfig(config.feedback());

  // Generation and completions on one order share this table.
  auto order_locks = std::make_shared<scheduling::OrderLocks>();

  // ------------------------------------------------------------------
  // Engine components
  // ------------------------------------------------------------------
  app.context.generator = std::make_shared<scheduling::ScheduleGenerator>(repository, shift_calendar, scheduling_options, order_locks);
  app.context.analyzer  = std::make_shared<analysis::CapacityAnalyzer>(repository, shift_calendar, scheduling_options, feedback_options);
  app.context.feedback  = std::make_shared<feedback::EfficiencyFeedback>(repository, shift_calendar, feedback_options, order_locks);

  // ------------------------------------------------------------------
  // Services and gRPC adapters
  // ------------------------------------------------------------------
  app.scheduling_service = std::make_shared<service::SchedulingService>(app.context);
  app.grpc_services.push_back(std::make_unique<grpc::SchedulingServer>(app.scheduling_service));

  return app;
}

} // namespace shopfloor::factory
