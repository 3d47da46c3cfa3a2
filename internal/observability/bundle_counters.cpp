#include "internal/observability/bundle_counters.hpp"

#include "internal/observability/metrics.hpp"

namespace courier::observability {

std::string_view ToString(BundleEvent event) {
  switch (event) {
    case BundleEvent::kCreated:
      return "created";
    case BundleEvent::kForwarded:
      return "forwarded";
    case BundleEvent::kReceived:
      return "received";
    case BundleEvent::kDelivered:
      return "delivered";
    case BundleEvent::kExpired:
      return "expired";
    case BundleEvent::kQuarantined:
      return "quarantined";
    case BundleEvent::kEvicted:
      return "evicted";
    case BundleEvent::kLost:
      return "lost";
    case BundleEvent::kRejected:
      return "rejected";
  }
  return "unknown";
}

void BundleCounters::Record(BundleEvent event, model::Priority priority, std::string_view topic, uint64_t n) {
  if (n == 0) return;
  {
    std::lock_guard lock(mutex_);
    counts_[Key{event, priority, std::string(topic)}] += n;
  }
  Metrics::Instance().RecordBundleEvent(ToString(event), model::ToString(priority), topic, n);
}

uint64_t BundleCounters::Count(BundleEvent event) const {
  std::lock_guard lock(mutex_);
  uint64_t        total = 0;
  for (const auto& [key, count] : counts_) {
    if (std::get<0>(key) == event) total += count;
  }
  return total;
}

uint64_t BundleCounters::Count(BundleEvent event, model::Priority priority, std::string_view topic) const {
  std::lock_guard lock(mutex_);
  auto            it = counts_.find(Key{event, priority, std::string(topic)});
  return it == counts_.end() ? 0 : it->second;
}

std::vector<BundleCounters::Entry> BundleCounters::Snapshot() const {
  std::lock_guard    lock(mutex_);
  std::vector<Entry> entries;
  entries.reserve(counts_.size());
  for (const auto& [key, count] : counts_) {
    entries.push_back(Entry{std::get<0>(key), std::get<1>(key), std::get<2>(key), count});
  }
  return entries;
}

} // namespace courier::observability
