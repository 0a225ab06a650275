#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/calendar/shift_calendar.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/time.hpp"

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void HandleSignal(int) {
  g_stop_requested = 1;
}

void PrintUsage() {
  std::cerr << "Usage: shopfloor-scheduler [--check-config] <config.yaml>\n"
               "       shopfloor-scheduler --config <config.yaml>\n";
}

// Resolves every engine section without opening the database or binding a port.
int CheckConfig(const shopfloor::runtime::config::RuntimeConfig& config) {
  const auto pattern    = shopfloor::config::ShiftPatternFromConfig(config.shift_calendar());
  const auto scheduling = shopfloor::config::SchedulingOptionsFromConfig(config.scheduling());
  const auto feedback   = shopfloor::config::FeedbackOptionsFromConfig(config.feedback());
  const auto server     = shopfloor::runtime::ServerOptionsFromConfig(config.server());

  shopfloor::calendar::StandardShiftCalendar calendar(pattern);

  std::cout << "bind_address: " << server.bind_address << "\n"
            << "shift: " << shopfloor::util::FormatTimeOfDay(pattern.day_start) << "-" << shopfloor::util::FormatTimeOfDay(pattern.day_end)
            << " (" << pattern.breaks.size() << " breaks, overtime until " << shopfloor::util::FormatTimeOfDay(pattern.overtime_end) << ")\n"
            << "working weekdays: " << pattern.working_weekdays.size() << ", holidays: " << pattern.holidays.size() << "\n"
            << "max crew: " << scheduling.max_crew_size << ", feedback window: " << feedback.window_size << "/" << feedback.min_samples << "\n"
            << "config ok\n";
  return 0;
}

void ShutdownObservability() {
  shopfloor::observability::ShutdownLogging();
  shopfloor::observability::ShutdownMetrics();
  shopfloor::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  bool        check_only = false;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else if (argc == 3 && std::string(argv[1]) == "--check-config") {
    config_path = argv[2];
    check_only  = true;
  } else {
    PrintUsage();
    return 1;
  }

  try {
    auto config = shopfloor::config::ConfigLoader::LoadFromYaml(config_path);
    if (check_only) {
      return CheckConfig(config);
    }

    shopfloor::observability::InitializeTracing(config);
    shopfloor::observability::InitializeMetrics(config);
    shopfloor::observability::InitializeLogging(config);

    auto                       app = shopfloor::factory::Build(config);
    shopfloor::runtime::Server server(shopfloor::runtime::ServerOptionsFromConfig(config.server()), std::move(app.grpc_services));

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    SHOPFLOOR_LOG_INFO("shopfloor scheduler started", {shopfloor::observability::StringField("config", config_path)});

    while (!g_stop_requested) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    SHOPFLOOR_LOG_INFO("shopfloor scheduler stopping");
    server.Stop();
    ShutdownObservability();
  } catch (const std::exception& e) {
    if (check_only) {
      std::cerr << "config error: " << e.what() << "\n";
      return 2;
    }
    SHOPFLOOR_LOG_ERROR("fatal error", {shopfloor::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
