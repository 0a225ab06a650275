#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/engine_options.hpp"
#include "internal/observability/export_target.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using shopfloor::config::ConfigLoader;
using shopfloor::util::ParseDate;
using shopfloor::util::ParseTimeOfDay;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "shopfloor_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "/var/lib/shopfloor/plant.db"
    wal_mode: true
logging:
  level: debug
shift_calendar:
  day_start: "06:00"
  day_end: "14:00"
  breaks:
    - start: "10:00"
      end: "10:20"
  working_weekdays: [1, 2, 3, 4, 5, 6]
  holidays: ["2026-12-25", "2026-12-26"]
  utc_offset_minutes: -300
scheduling:
  max_crew_size: 3
  sewing_workers_cover_other: true
feedback:
  window_size: 8
  min_samples: 4
  increase_threshold_percent: 115.5
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "0.0.0.0:50061");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/shopfloor/plant.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.logging().level() == "debug");
  assert(config.shift_calendar().breaks_size() == 1);
  assert(config.shift_calendar().working_weekdays_size() == 6);
  assert(config.scheduling().max_crew_size() == 3);
  assert(config.feedback().increase_threshold_percent() == 115.5);

  const auto pattern = shopfloor::config::ShiftPatternFromConfig(config.shift_calendar());
  assert(pattern.day_start == ParseTimeOfDay("06:00"));
  assert(pattern.day_end == ParseTimeOfDay("14:00"));
  assert(pattern.breaks.size() == 1);
  assert(pattern.breaks[0].end == ParseTimeOfDay("10:20"));
  assert(pattern.working_weekdays.size() == 6);
  assert(pattern.holidays.size() == 2);
  assert(pattern.holidays[1] == ParseDate("2026-12-26"));
  assert(pattern.overtime_end == ParseTimeOfDay("18:00"));
  assert(pattern.utc_offset_minutes == -300);

  const auto scheduling = shopfloor::config::SchedulingOptionsFromConfig(config.scheduling());
  assert(scheduling.max_crew_size == 3);
  assert(scheduling.sewing_workers_cover_other);
  assert(scheduling.write_retry_limit == 3);

  const auto feedback = shopfloor::config::FeedbackOptionsFromConfig(config.feedback());
  assert(feedback.window_size == 8);
  assert(feedback.min_samples == 4);
  assert(feedback.increase_threshold_percent == 115.5);
  assert(feedback.decrease_threshold_percent == 80.0);
}

void TestEmptyConfigKeepsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(!config.has_server());
  assert(config.database().backend_case() == shopfloor::runtime::config::DatabaseConfig::BACKEND_NOT_SET);

  const auto pattern = shopfloor::config::ShiftPatternFromConfig(config.shift_calendar());
  assert(pattern.day_start == ParseTimeOfDay("07:00"));
  assert(pattern.day_end == ParseTimeOfDay("15:30"));
  assert(pattern.breaks.size() == 1);
  assert(pattern.working_weekdays.size() == 5);
  assert(pattern.utc_offset_minutes == 0);

  const auto scheduling = shopfloor::config::SchedulingOptionsFromConfig(config.scheduling());
  assert(scheduling.max_crew_size == 1);
  assert(scheduling.generation_timeout_ms == 30'000);
  assert(scheduling.start_rounding_minutes == 15);

  const auto feedback = shopfloor::config::FeedbackOptionsFromConfig(config.feedback());
  assert(feedback.window_size == 10);
  assert(feedback.min_samples == 5);
  assert(feedback.lookback_days == 30);
}

void TestMemoryBackend() {
  auto config = ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");
  assert(config.database().has_memory());
}

void TestLateShiftMovesDefaultOvertime() {
  auto config = ConfigLoader::LoadFromYamlString(R"(shift_calendar:
  day_start: "12:00"
  day_end: "20:00"
)");
  const auto pattern = shopfloor::config::ShiftPatternFromConfig(config.shift_calendar());
  assert(pattern.overtime_end == ParseTimeOfDay("20:00"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
schedulng:
  max_crew_size: 2
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedDocumentsAreRejected() {
  auto expect_rejected = [](const std::string& yaml, const std::string& fragment) {
    bool threw = false;
    try {
      (void)ConfigLoader::LoadFromYamlString(yaml);
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()).find(fragment) != std::string::npos;
    }
    assert(threw);
  };

  expect_rejected("- server\n- database\n", "mapping");
  expect_rejected(R"(scheduling:
  max_crew_size: 2
  max_crew_size: 3
)",
                  "scheduling.max_crew_size");
}

void TestEnvironmentOverrides() {
  ::setenv("SHOPFLOOR_BIND_ADDRESS", "127.0.0.1:6001", 1);
  ::setenv("SHOPFLOOR_SQLITE_PATH", "/tmp/override.db", 1);
  auto config = ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "0.0.0.0:50061"
database:
  sqlite:
    path: "plant.db"
    wal_mode: true
)");
  ::unsetenv("SHOPFLOOR_BIND_ADDRESS");
  ::unsetenv("SHOPFLOOR_SQLITE_PATH");

  assert(config.server().bind_address() == "127.0.0.1:6001");
  assert(config.database().sqlite().path() == "/tmp/override.db");
  assert(config.database().sqlite().wal_mode());
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/shopfloor.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestInconsistentFeedbackThresholds() {
  auto expect_invalid = [](const std::string& yaml) {
    auto config = ConfigLoader::LoadFromYamlString(yaml);
    bool threw  = false;
    try {
      (void)shopfloor::config::FeedbackOptionsFromConfig(config.feedback());
    } catch (const shopfloor::util::ValidationError& e) {
      threw = e.kind() == shopfloor::util::ValidationErrorKind::kInvalidArgument;
    }
    assert(threw);
  };

  expect_invalid(R"(feedback:
  window_size: 3
  min_samples: 5
)");
  expect_invalid(R"(feedback:
  increase_threshold_percent: 90
  decrease_threshold_percent: 95
)");
}

void TestMalformedTimeIsRejected() {
  auto config = ConfigLoader::LoadFromYamlString(R"(shift_calendar:
  day_start: "7am"
)");
  bool threw = false;
  try {
    (void)shopfloor::config::ShiftPatternFromConfig(config.shift_calendar());
  } catch (const shopfloor::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestLoggingSettings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(logging:
  level: verbose
)");
  bool threw = false;
  try {
    shopfloor::observability::InitializeLogging(config);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("verbose") != std::string::npos;
  }
  assert(threw);

  assert(shopfloor::observability::TimeOfDayField("start", ParseTimeOfDay("07:15")).value == "07:15:00");
  assert(shopfloor::observability::DateField("due", ParseDate("2026-03-13")).value == "2026-03-13");
}

void TestExportTargets() {
  using shopfloor::observability::OtlpTransport;
  using shopfloor::observability::ResolveExportTarget;
  using shopfloor::observability::Signal;

  auto config = ConfigLoader::LoadFromYamlString(R"(observability:
  tracing_enabled: true
  otlp_endpoint: "http://collector:4318/"
  transport: OTLP_TRANSPORT_HTTP
  service_name: "plant-7-scheduler"
)");
  const auto traces = ResolveExportTarget(config.observability(), Signal::kTraces);
  assert(traces.transport == OtlpTransport::kHttpProtobuf);
  assert(traces.endpoint == "http://collector:4318/v1/traces");
  assert(traces.service_name == "plant-7-scheduler");
  assert(ResolveExportTarget(config.observability(), Signal::kMetrics).endpoint == "http://collector:4318/v1/metrics");

  config.mutable_observability()->set_otlp_endpoint("http://collector:4318/v1/traces");
  assert(ResolveExportTarget(config.observability(), Signal::kTraces).endpoint == "http://collector:4318/v1/traces");

  config.mutable_observability()->set_transport(shopfloor::runtime::config::OTLP_TRANSPORT_GRPC);
  config.mutable_observability()->set_otlp_endpoint("collector:4317");
  config.mutable_observability()->clear_service_name();
  const auto grpc_target = ResolveExportTarget(config.observability(), Signal::kMetrics);
  assert(grpc_target.transport == OtlpTransport::kGrpc);
  assert(grpc_target.endpoint == "collector:4317");
  assert(grpc_target.service_name == "shopfloor-scheduler");
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestEmptyConfigKeepsDefaults();
  TestMemoryBackend();
  TestLateShiftMovesDefaultOvertime();
  TestUnknownFieldsAreRejected();
  TestMalformedDocumentsAreRejected();
  TestEnvironmentOverrides();
  TestMissingFileIsReported();
  TestInconsistentFeedbackThresholds();
  TestMalformedTimeIsRejected();
  TestLoggingSettings();
  TestExportTargets();

  std::cout << "shopfloor_unit_config_loader: pass\n";
  return 0;
}
