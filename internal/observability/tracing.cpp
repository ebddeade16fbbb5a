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
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <cstdlib>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ragturn::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using ragturn::runtime::config::ObservabilityConfig_TracingConfig;

namespace {
constexpr const char* kTracerName      = "ragturn";
constexpr const char* kTracerVersion   = "0.1.0";
constexpr const char* kAttributePrefix = "ragturn.";

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::string TracesEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) return config.endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT")) return endpoint;
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) return endpoint;
  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpConfig& config) {
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = TracesEndpoint(config);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = TracesEndpoint(config);
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const ObservabilityConfig_TracingConfig& tracing, const OtlpConfig& otlp_config) {
  if (tracing.processor() == ObservabilityConfig_TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(MakeExporter(otlp_config));
  }

  // zero keeps the SDK default
  sdktrace::BatchSpanProcessorOptions options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(otlp_config), options);
}

// Null means the SDK's parent-based default.
std::unique_ptr<sdktrace::Sampler> MakeSampler(const ObservabilityConfig_TracingConfig& tracing) {
  switch (tracing.trace_hint()) {
    case ObservabilityConfig_TracingConfig::TRACE_HINT_ALWAYS:
      return sdktrace::AlwaysOnSamplerFactory::Create();
    case ObservabilityConfig_TracingConfig::TRACE_HINT_NEVER:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    default:
      return nullptr;
  }
}

bool Install(std::unique_ptr<sdktrace::TracerProvider> provider) {
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kTracerName, kTracerVersion);
  return static_cast<bool>(g_tracer);
}

bool Install(std::unique_ptr<sdktrace::SpanProcessor> processor, const OtlpConfig& config, std::unique_ptr<sdktrace::Sampler> sampler) {
  resource::ResourceAttributes attrs   = {{"service.name", config.service_name}};
  auto                         service = resource::Resource::Create(attrs);
  if (sampler) {
    return Install(sdktrace::TracerProviderFactory::Create(std::move(processor), service, std::move(sampler)));
  }
  return Install(sdktrace::TracerProviderFactory::Create(std::move(processor), service));
}

} // namespace

bool InitializeTracing(const OtlpConfig& config) {
  return Install(sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{}), config, nullptr);
}

bool InitializeTracing(const ragturn::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == ragturn::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  return Install(MakeProcessor(observability.tracing(), otlp_config), otlp_config, MakeSampler(observability.tracing()));
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

  bool active() const {
    return static_cast<bool>(span);
  }
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kTracerName, kTracerVersion);
    }
  }
  if (!g_tracer) return;

  impl_->span  = g_tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(g_tracer->WithActiveSpan(impl_->span));

  for (const auto& field : CurrentLogContext()) {
    impl_->span->SetAttribute(kAttributePrefix + field.key, field.value);
  }
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->active()) impl_->span->End();
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->active()) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_ && impl_->active()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::SetAttribute(std::string_view key, double value) {
  if (impl_ && impl_->active()) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::AddEvent(std::string_view name) {
  if (impl_ && impl_->active()) impl_->span->AddEvent(std::string(name));
}

void SpanScope::RecordException(const std::exception& error) {
  if (!impl_ || !impl_->active()) return;

  const std::string description = error.what();
  if (const auto* typed = dynamic_cast<const util::Error*>(&error); typed && !typed->code().empty()) {
    impl_->span->SetAttribute(std::string(kAttributePrefix) + "error_code", typed->code());
  }
  impl_->span->AddEvent("exception", {{"exception.message", description}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, description);
}

} // namespace ragturn::observability

#endif
