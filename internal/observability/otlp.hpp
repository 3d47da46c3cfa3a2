#pragma once

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace courier::runtime::config {
class RuntimeConfig;
}

namespace courier::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpSettings {
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Endpoint precedence: config, OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT,
// OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport.
OtlpSettings ResolveOtlpSettings(const courier::runtime::config::RuntimeConfig& config, OtlpSignal signal);

// service.name=courierd plus the store backend, shared by both providers.
opentelemetry::sdk::resource::Resource NodeResource(const courier::runtime::config::RuntimeConfig& config);

inline constexpr const char* kInstrumentationScope   = "courier";
inline constexpr const char* kInstrumentationVersion = "0.1.0";

} // namespace courier::observability
