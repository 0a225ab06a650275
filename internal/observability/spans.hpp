#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace shopfloor::runtime::config {
class RuntimeConfig;
}

namespace shopfloor::observability {

// Both return false when the signal is disabled in config or at build time.
bool InitializeTracing(const shopfloor::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const shopfloor::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// Active span for the enclosing scope; a no-op without a tracer provider.
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveGenerationDurationMs(std::string_view op, double duration_ms);
  void RecordScheduleWarnings(std::string_view kind, std::uint64_t count);
  void RecordProficiencyChange(std::string_view reason);
  void ObserveOrdersAtRisk(std::uint64_t at_risk, std::uint64_t evaluated);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const shopfloor::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const shopfloor::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {}
inline void ShutdownMetrics() {}

inline SpanScope::SpanScope(std::string_view) {}
inline SpanScope::~SpanScope() {}
inline SpanScope::SpanScope(SpanScope&&) noexcept            = default;
inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {}
inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {}
inline void SpanScope::SetAttribute(std::string_view, double) {}
inline void SpanScope::AddEvent(std::string_view) {}
inline void SpanScope::RecordException(std::string_view) {}

inline Metrics::Metrics() {}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {}
inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {}
inline void Metrics::ObserveGenerationDurationMs(std::string_view, double) {}
inline void Metrics::RecordScheduleWarnings(std::string_view, std::uint64_t) {}
inline void Metrics::RecordProficiencyChange(std::string_view) {}
inline void Metrics::ObserveOrdersAtRisk(std::uint64_t, std::uint64_t) {}
#endif

} // namespace shopfloor::observability
