#pragma once

#include <cstdint>
#include <string>

namespace courier::db::model {

enum class QueueStatus : uint8_t {
  kPending         = 0, // offered or failed, retry after next_attempt_ms
  kTransferred     = 1, // neighbor confirmed receipt
  kCustodyAccepted = 2, // neighbor confirmed receipt and holds custody
};

/*
  Per (bundle, neighbor) transport state. Written only by the propagation
  layer through the store.
*/
struct QueueRecord {
  std::string bundle_id;
  std::string neighbor_id;

  uint32_t    attempts        = 0;
  uint64_t    last_attempt_ms = 0;
  uint64_t    next_attempt_ms = 0;
  QueueStatus status          = QueueStatus::kPending;
};

} // namespace courier::db::model
