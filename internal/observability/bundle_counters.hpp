#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "internal/model/bundle.hpp"

namespace courier::observability {

enum class BundleEvent : uint8_t {
  kCreated,
  kForwarded,
  kReceived,
  kDelivered,
  kExpired,
  kQuarantined,
  kEvicted,
  kLost,
  kRejected,
};

std::string_view ToString(BundleEvent event);

/*
  Aggregate bundle lifecycle counters keyed by (event, priority, topic).

  Only aggregates are kept; no bundle ids or sources. Each Record() is also
  forwarded to the OTel meter when metrics are enabled.
*/
class BundleCounters {
 public:
  struct Entry {
    BundleEvent     event;
    model::Priority priority;
    std::string     topic;
    uint64_t        count;
  };

  void Record(BundleEvent event, model::Priority priority, std::string_view topic, uint64_t n = 1);

  uint64_t Count(BundleEvent event) const;
  uint64_t Count(BundleEvent event, model::Priority priority, std::string_view topic) const;

  // Sorted by event, priority, topic.
  std::vector<Entry> Snapshot() const;

 private:
  using Key = std::tuple<BundleEvent, model::Priority, std::string>;

  mutable std::mutex       mutex_;
  std::map<Key, uint64_t> counts_;
};

} // namespace courier::observability
