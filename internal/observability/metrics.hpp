#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace courier::runtime::config {
class RuntimeConfig;
}

namespace courier::observability {

bool InitializeMetrics(const courier::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide OTLP instruments:

    courier.bundle.events          counter    event, priority[, topic]
    courier.store.occupancy_bytes  gauge
    courier.contact.transfers      counter    direction
    courier.admin.requests         counter    route, success
    courier.admin.latency_ms       histogram  route

  BundleCounters stays the source of truth for Stats; these mirror it for
  the collector. Without ENABLE_OTEL every call is a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordBundleEvent(std::string_view event, std::string_view priority, std::string_view topic, std::uint64_t n = 1);
  void SetStoreOccupancyBytes(std::uint64_t bytes);

  // Bundles moved during one closed neighbor session.
  void RecordContact(std::uint64_t bundles_sent, std::uint64_t bundles_received);

  void RecordAdminRequest(std::string_view route, bool success, double latency_ms);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const courier::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() = default;

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordBundleEvent(std::string_view, std::string_view, std::string_view, std::uint64_t) {
}

inline void Metrics::SetStoreOccupancyBytes(std::uint64_t) {
}

inline void Metrics::RecordContact(std::uint64_t, std::uint64_t) {
}

inline void Metrics::RecordAdminRequest(std::string_view, bool, double) {
}
#endif

} // namespace courier::observability
