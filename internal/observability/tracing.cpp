#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/samplers/always_off_factory.h>
#include <opentelemetry/sdk/trace/samplers/always_on_factory.h>
#include <opentelemetry/sdk/trace/samplers/parent_factory.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <chrono>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace courier::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;

using TracingConfig = courier::runtime::config::ObservabilityConfig_TracingConfig;

namespace {

std::mutex                                          g_mutex;
std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const TracingConfig& tracing, std::unique_ptr<sdktrace::SpanExporter> exporter) {
  if (tracing.processor() == TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }

  sdktrace::BatchSpanProcessorOptions options;
  const auto&                         batch = tracing.batch();
  if (batch.max_queue_size() > 0) options.max_queue_size = batch.max_queue_size();
  if (batch.max_export_batch_size() > 0) options.max_export_batch_size = batch.max_export_batch_size();
  if (batch.schedule_delay_ms() > 0) options.schedule_delay_millis = std::chrono::milliseconds(batch.schedule_delay_ms());
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), options);
}

// Unset hint follows the parent, sampling roots.
std::unique_ptr<sdktrace::Sampler> MakeSampler(const TracingConfig& tracing) {
  switch (tracing.trace_hint()) {
    case TracingConfig::TRACE_HINT_ALWAYS:
      return sdktrace::AlwaysOnSamplerFactory::Create();
    case TracingConfig::TRACE_HINT_NEVER:
      return sdktrace::AlwaysOffSamplerFactory::Create();
    default:
      return sdktrace::ParentBasedSamplerFactory::Create(std::shared_ptr<sdktrace::Sampler>(sdktrace::AlwaysOnSamplerFactory::Create()));
  }
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  std::lock_guard lock(g_mutex);
  if (!g_tracer) {
    // a provider installed by the host process still counts
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer(kInstrumentationScope, kInstrumentationVersion);
    }
  }
  return g_tracer;
}

} // namespace

bool InitializeTracing(const courier::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  const auto settings  = ResolveOtlpSettings(config, OtlpSignal::kTraces);
  auto       processor = MakeProcessor(observability.tracing(), MakeExporter(settings));
  auto       provider  = sdktrace::TracerProviderFactory::Create(std::move(processor), NodeResource(config), MakeSampler(observability.tracing()));

  std::lock_guard lock(g_mutex);
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(std::move(provider));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer(kInstrumentationScope, kInstrumentationVersion);
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  std::lock_guard lock(g_mutex);
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

// ---------------------------------------------------------------------------
// SpanScope
// ---------------------------------------------------------------------------

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }
  impl_        = std::make_unique<Impl>();
  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

void SpanScope::SetBundle(std::string_view hex_id) {
  SetAttribute("courier.bundle_id", hex_id);
}

void SpanScope::SetNeighbor(std::string_view node_id) {
  SetAttribute("courier.neighbor_id", node_id);
}

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), std::string(value));
}

void SpanScope::SetAttribute(std::string_view key, std::int64_t value) {
  if (impl_) impl_->span->SetAttribute(std::string(key), value);
}

void SpanScope::Fail(std::string_view description) {
  if (!impl_) return;
  impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
}

} // namespace courier::observability

#endif
