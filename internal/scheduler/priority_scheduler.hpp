#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/bundle.hpp"

namespace courier::scheduler {

/*
  A bundle eligible for transfer to one neighbor, with the transport state
  recorded for that neighbor.
*/
struct QueueEntry {
  std::string id; // hex

  model::Priority priority       = model::Priority::kNormal;
  uint64_t        expires_at_ms  = 0;
  uint16_t        hops_remaining = 0;

  model::Audience audience = model::Audience::kPublic;
  std::string     topic;
  std::string     destination;

  uint32_t attempts        = 0;
  uint64_t next_attempt_ms = 0;
};

/*
  Stateless ordering of outbound bundles:
    1. priority (emergency first)
    2. earliest expiry
    3. fewest hops remaining
    4. id, so the order is total
*/
class PriorityScheduler {
 public:
  static bool Before(const QueueEntry& a, const QueueEntry& b);

  static std::vector<QueueEntry> Order(std::vector<QueueEntry> entries);
};

} // namespace courier::scheduler
