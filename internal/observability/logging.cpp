#include "internal/observability/logging.hpp"

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/util/time.hpp"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace shopfloor::observability {
namespace {

constexpr const char* kLoggerName     = "shopfloor-scheduler";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";

bool g_include_trace_context{false};

std::string EnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name)) return value;
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw std::runtime_error("unknown log level '" + name + "'");
  }
  return level;
}

bool TraceContextEnabled(const shopfloor::runtime::config::RuntimeConfig& config) {
  if (const char* include_trace = std::getenv("SHOPFLOOR_LOG_INCLUDE_TRACE_CONTEXT")) {
    const std::string value(include_trace);
    return value == "1" || value == "true";
  }
  return config.logging().include_trace_context();
}

std::vector<spdlog::sink_ptr> BuildSinks(const shopfloor::runtime::config::LoggingConfig& config) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

  if (!config.file().empty()) {
    const std::size_t max_mb    = config.max_file_mb() > 0 ? config.max_file_mb() : 64;
    const std::size_t max_files = config.max_files() > 0 ? config.max_files() : 5;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(config.file(), max_mb * 1024 * 1024, max_files));
  }
  return sinks;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  return value.find_first_of(" \t\"=") != std::string::npos;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out += '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out += '\\';
    out += c;
  }
  out += '"';
}

#ifdef ENABLE_OTEL
std::string HexId(const uint8_t* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(data[i] >> 4) & 0x0F]);
    result.push_back(kHex[data[i] & 0x0F]);
  }
  return result;
}

void AppendTraceContext(std::string& line) {
  if (!g_include_trace_context) return;

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) return;

  auto context = span->GetContext();
  if (!context.IsValid()) return;

  uint8_t trace_bytes[16];
  uint8_t span_bytes[8];
  context.trace_id().CopyBytesTo(trace_bytes);
  context.span_id().CopyBytesTo(span_bytes);
  line += " trace_id=" + HexId(trace_bytes, 16) + " span_id=" + HexId(span_bytes, 8);
}
#else
void AppendTraceContext(std::string&) {}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

LogField DoubleField(std::string_view key, double value) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.2f", value);
  return {std::string(key), buf};
}

LogField DateField(std::string_view key, std::chrono::sys_days value) {
  return {std::string(key), shopfloor::util::FormatDate(value)};
}

LogField TimeOfDayField(std::string_view key, std::int32_t seconds) {
  return {std::string(key), shopfloor::util::FormatTimeOfDay(seconds)};
}

void InitializeLogging(const shopfloor::runtime::config::RuntimeConfig& config) {
  const auto level   = ParseLevel(EnvOr("SHOPFLOOR_LOG_LEVEL", config.logging().level(), "info"));
  const auto pattern = EnvOr("SHOPFLOOR_LOG_PATTERN", config.logging().pattern(), kDefaultPattern);

  auto sinks  = BuildSinks(config.logging());
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(pattern);
  logger->set_level(level);
  logger->set_error_handler([](const std::string& msg) { std::fprintf(stderr, "log sink error: %s\n", msg.c_str()); });
  logger->flush_on(spdlog::level::warn);

  spdlog::set_default_logger(std::move(logger));
  g_include_trace_context = TraceContextEnabled(config);
}

void ShutdownLogging() {
  if (auto logger = spdlog::default_logger()) logger->flush();
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  if (!spdlog::should_log(level)) return;

  std::string line(message);
  for (const auto& field : fields) {
    line += ' ';
    line += field.key;
    line += '=';
    AppendValue(line, field.value);
  }
  AppendTraceContext(line);

  spdlog::log(level, "{}", line);
}

} // namespace shopfloor::observability
