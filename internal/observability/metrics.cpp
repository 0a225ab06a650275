#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <memory>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/export_target.hpp"

namespace shopfloor::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;
bool                                       g_route_labels_enabled{true};

opentelemetry::nostd::string_view Label(std::string_view value) {
  return {value.data(), value.size()};
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const ExportTarget& target) {
  if (target.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::chrono::milliseconds OrDefault(std::uint32_t configured_ms, std::chrono::milliseconds fallback) {
  return configured_ms > 0 ? std::chrono::milliseconds(configured_ms) : fallback;
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      generation_duration_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> schedule_warnings;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> proficiency_changes;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      orders_at_risk_ratio;
};

bool InitializeMetrics(const shopfloor::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metric_config = observability.metrics();
  g_route_labels_enabled    = metric_config.route_labels_enabled();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = OrDefault(metric_config.collection_interval_ms(), std::chrono::milliseconds(1000));
  reader_options.export_timeout_millis  = OrDefault(metric_config.export_timeout_ms(), std::chrono::milliseconds(500));

  const auto target = ResolveExportTarget(observability, Signal::kMetrics);
  auto       reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(target), reader_options);

  resource::ResourceAttributes attrs = {{"service.name", target.service_name}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), resource::Resource::Create(attrs));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// Instruments bind to whichever provider is installed on first use.
Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("shopfloor-scheduler", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("shopfloor.request.count", "Scheduling service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("shopfloor.request.latency_ms", "Scheduling service request latency", "ms");
  impl_->generation_duration_ms =
      impl_->meter->CreateDoubleHistogram("shopfloor.schedule.generation_ms", "Schedule generation and replan duration", "ms");
  impl_->schedule_warnings   = impl_->meter->CreateUInt64Counter("shopfloor.schedule.warnings", "Warnings attached to generated schedules", "1");
  impl_->proficiency_changes = impl_->meter->CreateUInt64Counter("shopfloor.proficiency.changes", "Applied proficiency level changes", "1");
  impl_->orders_at_risk_ratio =
      impl_->meter->CreateDoubleHistogram("shopfloor.capacity.orders_at_risk_ratio", "Share of open orders that cannot meet their due date", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const opentelemetry::context::Context ctx;
  if (g_route_labels_enabled) {
    impl_->request_count->Add(1, Attributes{{"route", Label(route)}, {"success", success}}, ctx);
  } else {
    impl_->request_count->Add(1, Attributes{{"success", success}}, ctx);
  }
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  const opentelemetry::context::Context ctx;
  if (g_route_labels_enabled) {
    impl_->request_latency_ms->Record(latency_ms, Attributes{{"route", Label(route)}}, ctx);
  } else {
    impl_->request_latency_ms->Record(latency_ms, Attributes{}, ctx);
  }
}

void Metrics::ObserveGenerationDurationMs(std::string_view op, double duration_ms) {
  impl_->generation_duration_ms->Record(duration_ms, Attributes{{"op", Label(op)}}, opentelemetry::context::Context{});
}

void Metrics::RecordScheduleWarnings(std::string_view kind, std::uint64_t count) {
  if (count == 0) return;
  impl_->schedule_warnings->Add(count, Attributes{{"kind", Label(kind)}}, opentelemetry::context::Context{});
}

void Metrics::RecordProficiencyChange(std::string_view reason) {
  impl_->proficiency_changes->Add(1, Attributes{{"reason", Label(reason)}}, opentelemetry::context::Context{});
}

void Metrics::ObserveOrdersAtRisk(std::uint64_t at_risk, std::uint64_t evaluated) {
  if (evaluated == 0) return;
  impl_->orders_at_risk_ratio->Record(static_cast<double>(at_risk) / static_cast<double>(evaluated), Attributes{},
                                      opentelemetry::context::Context{});
}

} // namespace shopfloor::observability

#endif
