#include "internal/scheduler/priority_scheduler.hpp"

#include <algorithm>
#include <tuple>

namespace courier::scheduler {

bool PriorityScheduler::Before(const QueueEntry& a, const QueueEntry& b) {
  return std::tie(a.priority, a.expires_at_ms, a.hops_remaining, a.id) < std::tie(b.priority, b.expires_at_ms, b.hops_remaining, b.id);
}

std::vector<QueueEntry> PriorityScheduler::Order(std::vector<QueueEntry> entries) {
  std::sort(entries.begin(), entries.end(), &PriorityScheduler::Before);
  return entries;
}

} // namespace courier::scheduler
