#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/bundle.hpp"

namespace courier::db::model {

/*
  Persistent bundle row.

  The wire blob is the authoritative copy; the other columns are indexes
  and bookkeeping derived from it at insert time. Only custody_state is
  updated afterwards.
*/
struct BundleRecord {
  std::string id; // hex of the 32-byte content id

  std::string topic;
  std::string destination;

  courier::model::Priority     priority      = courier::model::Priority::kNormal;
  courier::model::Audience     audience      = courier::model::Audience::kPublic;
  courier::model::CustodyState custody_state = courier::model::CustodyState::kNone;

  bool custody_requested = false;
  bool custody_ack       = false;

  uint64_t created_at_ms = 0;
  uint64_t expires_at_ms = 0;
  uint16_t hop_count     = 0;
  uint16_t hop_limit     = 0;

  uint64_t size_bytes   = 0;
  uint64_t stored_at_ms = 0;

  // Empty when a listing was made without wire bytes.
  std::vector<uint8_t> wire;

  uint16_t HopsRemaining() const {
    return hop_count >= hop_limit ? 0 : static_cast<uint16_t>(hop_limit - hop_count);
  }
};

} // namespace courier::db::model
