#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <string>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define COURIER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define COURIER_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace courier::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
using Attributes    = std::initializer_list<AttributePair>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Written once by InitializeMetrics before any node thread starts.
struct Toggles {
  bool admin{true};
  bool bundles{true};
  bool topic_labels{false};
};
Toggles g_toggles;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeExporter(const OtlpSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const courier::runtime::config::ObservabilityConfig_MetricsConfig& config,
                                                     std::unique_ptr<sdkmetrics::PushMetricExporter>             exporter) {
  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  const uint32_t interval_ms     = config.collection_interval_ms() > 0 ? config.collection_interval_ms() : 1000;
  options.export_interval_millis = std::chrono::milliseconds(std::max(config.min_collection_interval_ms(), interval_ms));
  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(config.export_timeout_ms());
  }
#ifdef COURIER_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), options);
#endif
}

// SDK releases differ on whether AddMetricReader takes unique or shared
// ownership, and on whether Add/Record take an explicit context.
void AttachReader(sdkmetrics::MeterProvider& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider.AddMetricReader(std::move(reader)); }) {
    provider.AddMetricReader(std::move(reader));
  } else {
    provider.AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Counter>
void Add(const Counter& counter, std::uint64_t n, Attributes attributes) {
  if constexpr (requires { counter->Add(n, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(n, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(n, attributes);
  }
}

template <typename Histogram>
void Record(const Histogram& histogram, double value, Attributes attributes) {
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> bundle_events;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> contact_transfers;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> admin_requests;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      admin_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   store_occupancy;

  std::atomic<std::int64_t> occupancy_bytes{0};
};

bool InitializeMetrics(const courier::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& metrics = observability.metrics();
  auto        reader  = MakeReader(metrics, MakeExporter(ResolveOtlpSettings(config, OtlpSignal::kMetrics)));

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::make_unique<sdkmetrics::ViewRegistry>(), NodeResource(config));
  AttachReader(*g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_toggles.admin        = metrics.request_metrics_enabled();
  g_toggles.bundles      = metrics.bundle_metrics_enabled();
  g_toggles.topic_labels = metrics.topic_labels_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter(kInstrumentationScope, kInstrumentationVersion);

  impl_->bundle_events     = impl_->meter->CreateUInt64Counter("courier.bundle.events", "Bundle lifecycle events", "1");
  impl_->contact_transfers = impl_->meter->CreateUInt64Counter("courier.contact.transfers", "Bundles moved per neighbor session", "1");
  impl_->admin_requests    = impl_->meter->CreateUInt64Counter("courier.admin.requests", "Admin API calls", "1");
  impl_->admin_latency_ms  = impl_->meter->CreateDoubleHistogram("courier.admin.latency_ms", "Admin API call latency", "ms");
  impl_->store_occupancy   = impl_->meter->CreateInt64ObservableGauge("courier.store.occupancy_bytes", "Encoded bytes held by the bundle store", "By");
  impl_->store_occupancy->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        using Observer = opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>;
        opentelemetry::nostd::get<Observer>(result)->Observe(impl->occupancy_bytes.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordBundleEvent(std::string_view event, std::string_view priority, std::string_view topic, std::uint64_t n) {
  if (!g_toggles.bundles || n == 0) {
    return;
  }
  const std::string event_label(event);
  const std::string priority_label(priority);
  if (g_toggles.topic_labels) {
    Add(impl_->bundle_events, n, {{"event", event_label}, {"priority", priority_label}, {"topic", std::string(topic)}});
    return;
  }
  Add(impl_->bundle_events, n, {{"event", event_label}, {"priority", priority_label}});
}

void Metrics::SetStoreOccupancyBytes(std::uint64_t bytes) {
  impl_->occupancy_bytes.store(static_cast<std::int64_t>(bytes));
}

void Metrics::RecordContact(std::uint64_t bundles_sent, std::uint64_t bundles_received) {
  if (!g_toggles.bundles) {
    return;
  }
  if (bundles_sent > 0) Add(impl_->contact_transfers, bundles_sent, {{"direction", "sent"}});
  if (bundles_received > 0) Add(impl_->contact_transfers, bundles_received, {{"direction", "received"}});
}

void Metrics::RecordAdminRequest(std::string_view route, bool success, double latency_ms) {
  if (!g_toggles.admin) {
    return;
  }
  const std::string route_label(route);
  Add(impl_->admin_requests, 1, {{"route", route_label}, {"success", success}});
  Record(impl_->admin_latency_ms, latency_ms, {{"route", route_label}});
}

} // namespace courier::observability

#endif
