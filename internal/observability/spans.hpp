#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace courier::runtime::config {
class RuntimeConfig;
}

namespace courier::observability {

bool InitializeTracing(const courier::runtime::config::RuntimeConfig& config);
void ShutdownTracing();

/*
  RAII span around one unit of node work: a submit, an ingest, a store put,
  a reaper sweep, an admin RPC. Without ENABLE_OTEL every call is a no-op.

  Bundle and neighbor ids are recorded in full as courier.bundle_id and
  courier.neighbor_id so a bundle can be followed across nodes that export
  to the same collector.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetBundle(std::string_view hex_id);
  void SetNeighbor(std::string_view node_id);
  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);

  // Marks the span failed.
  void Fail(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const courier::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() = default;

inline void SpanScope::SetBundle(std::string_view) {
}

inline void SpanScope::SetNeighbor(std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::Fail(std::string_view) {
}
#endif

} // namespace courier::observability
