#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include "config/config.pb.h"

namespace courier::observability {
namespace {

const char* SignalEnv(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT";
}

std::string DefaultEndpoint(OtlpTransport transport, OtlpSignal signal) {
  if (transport == OtlpTransport::kGrpc) {
    return "localhost:4317";
  }
  return signal == OtlpSignal::kTraces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
}

} // namespace

OtlpSettings ResolveOtlpSettings(const courier::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.transport =
      observability.transport() == courier::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  if (!observability.otlp_endpoint().empty()) {
    settings.endpoint = observability.otlp_endpoint();
  } else if (const char* endpoint = std::getenv(SignalEnv(signal))) {
    settings.endpoint = endpoint;
  } else if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    settings.endpoint = endpoint;
  } else {
    settings.endpoint = DefaultEndpoint(settings.transport, signal);
  }

  if (const char* insecure = std::getenv("OTEL_EXPORTER_OTLP_INSECURE")) {
    settings.insecure = std::string(insecure) != "false";
  }
  return settings;
}

opentelemetry::sdk::resource::Resource NodeResource(const courier::runtime::config::RuntimeConfig& config) {
  const char* backend = config.database().has_sqlite() ? "sqlite" : "memory";

  opentelemetry::sdk::resource::ResourceAttributes attrs = {
      {"service.name", "courierd"},
      {"service.version", kInstrumentationVersion},
      {"courier.store.backend", backend},
  };
  return opentelemetry::sdk::resource::Resource::Create(attrs);
}

} // namespace courier::observability
