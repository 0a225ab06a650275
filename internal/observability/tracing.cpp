#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/samplers/trace_id_ratio_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <algorithm>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/export_target.hpp"

namespace shopfloor::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

namespace {
using TracingConfig = shopfloor::runtime::config::ObservabilityConfig_TracingConfig;

constexpr const char* kTracerName    = "shopfloor-scheduler";
constexpr const char* kTracerVersion = "0.1.0";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> BuildExporter(const ExportTarget& target) {
  if (target.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = target.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = target.endpoint;
  options.use_ssl_credentials = !target.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> BuildProcessor(const TracingConfig& config, std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (config.simple_processor()) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
}

std::unique_ptr<sdktrace::Sampler> BuildSampler(const TracingConfig& config) {
  switch (config.sampler()) {
    case TracingConfig::SAMPLER_ALWAYS_OFF:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    case TracingConfig::SAMPLER_RATIO: {
      const double ratio = std::clamp(config.sample_ratio(), 0.0, 1.0);
      return sdktrace::ParentBasedSamplerFactory::Create(std::shared_ptr<sdktrace::Sampler>(sdktrace::TraceIdRatioBasedSamplerFactory::Create(ratio)));
    }
    default:
      return sdktrace::AlwaysOnSamplerFactory::Create();
  }
}

} // namespace

bool InitializeTracing(const shopfloor::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto target = ResolveExportTarget(observability, Signal::kTraces);

  resource::ResourceAttributes attrs = {{"service.name", target.service_name}, {"service.version", kTracerVersion}};
  auto provider = sdktrace::TracerProviderFactory::Create(BuildProcessor(observability.tracing(), BuildExporter(target)), resource::Resource::Create(attrs),
                                                          BuildSampler(observability.tracing()));

  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) {
  if (!g_tracer) return;

  impl_        = std::make_unique<Impl>();
  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (!impl_) return;
  impl_->scope.reset();
  impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(std::string_view description) {
  if (!impl_) return;
  const std::string message(description);
  impl_->span->AddEvent("exception", {{"exception.message", message}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, message);
}

} // namespace shopfloor::observability

#endif
