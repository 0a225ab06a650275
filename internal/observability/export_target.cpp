#include "internal/observability/export_target.hpp"

#include <cstdlib>
#include <string_view>

namespace shopfloor::observability {
namespace {

std::string_view SignalPath(Signal signal) {
  return signal == Signal::kTraces ? "/v1/traces" : "/v1/metrics";
}

const char* SignalEnv(Signal signal) {
  return signal == Signal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string WithSignalPath(std::string base, Signal signal) {
  const auto path = SignalPath(signal);
  if (base.size() >= path.size() && base.compare(base.size() - path.size(), path.size(), path) == 0) {
    return base;
  }
  while (!base.empty() && base.back() == '/') base.pop_back();
  return base + std::string(path);
}

} // namespace

ExportTarget ResolveExportTarget(const shopfloor::runtime::config::ObservabilityConfig& config, Signal signal) {
  ExportTarget target;
  if (!config.service_name().empty()) target.service_name = config.service_name();
  target.transport = config.transport() == shopfloor::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  const bool http = target.transport == OtlpTransport::kHttpProtobuf;

  if (!config.otlp_endpoint().empty()) {
    target.endpoint = http ? WithSignalPath(config.otlp_endpoint(), signal) : config.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEnv(signal))) {
    target.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    target.endpoint = http ? WithSignalPath(endpoint, signal) : endpoint;
  } else {
    target.endpoint = http ? WithSignalPath("http://localhost:4318", signal) : "localhost:4317";
  }
  return target;
}

} // namespace shopfloor::observability
