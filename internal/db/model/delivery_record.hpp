#pragma once

#include <cstdint>
#include <string>

namespace courier::db::model {

// One local delivery. seq is assigned on append and is strictly increasing.
struct DeliveryRecord {
  uint64_t    seq = 0;
  std::string bundle_id;
  std::string topic;
  uint64_t    delivered_at_ms = 0;
};

} // namespace courier::db::model
