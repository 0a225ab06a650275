#pragma once

#include <spdlog/common.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace shopfloor::runtime::config {
class RuntimeConfig;
}

namespace shopfloor::observability {

/*
  Structured key=value logging over spdlog.

  Lines read "<message> key=value ..."; values holding spaces, quotes or '='
  are double-quoted so worker and step names survive a split on spaces.
  Logging before InitializeLogging() goes to spdlog's default logger.
*/
struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField BoolField(std::string_view key, bool value);
LogField DoubleField(std::string_view key, double value);
LogField DateField(std::string_view key, std::chrono::sys_days value);
// Seconds since local midnight, written as HH:MM:SS.
LogField TimeOfDayField(std::string_view key, std::int32_t seconds);

// Throws std::runtime_error for an unknown level name.
void InitializeLogging(const shopfloor::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace shopfloor::observability

#define SHOPFLOOR_LOG_INFO(message, ...) ::shopfloor::observability::LogInfo((message), ##__VA_ARGS__)
#define SHOPFLOOR_LOG_WARN(message, ...) ::shopfloor::observability::LogWarn((message), ##__VA_ARGS__)
#define SHOPFLOOR_LOG_ERROR(message, ...) ::shopfloor::observability::LogError((message), ##__VA_ARGS__)
