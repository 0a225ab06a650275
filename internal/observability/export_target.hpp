#pragma once

#include <string>

#include "config/config.pb.h"

namespace shopfloor::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class Signal {
  kTraces,
  kMetrics,
};

// Where one telemetry signal is exported to.
struct ExportTarget {
  std::string   service_name{"shopfloor-scheduler"};
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

/*
  Endpoint precedence: otlp_endpoint from config, then the signal-specific
  OTEL_EXPORTER_OTLP_{TRACES,METRICS}_ENDPOINT, then OTEL_EXPORTER_OTLP_ENDPOINT,
  then the collector default. Over HTTP a base URL from config or the generic
  variable gets the signal path (/v1/traces, /v1/metrics) appended.
*/
ExportTarget ResolveExportTarget(const shopfloor::runtime::config::ObservabilityConfig& config, Signal signal);

} // namespace shopfloor::observability
