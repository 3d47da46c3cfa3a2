#pragma once

#include <cstdint>
#include <string_view>

namespace courier::store {

enum class RejectReason : uint8_t {
  kMalformed,
  kSignatureInvalid,
  kExpired,
  kHopLimitExceeded,
  kStorageFull,
};

std::string_view ToString(RejectReason reason);

enum class PutStatus : uint8_t {
  kInserted,
  kDuplicateIgnored,
  kRejected,
};

/*
  Tagged result of BundleStore::Put. A duplicate is not an error: the stored
  copy wins and is left untouched.
*/
struct PutOutcome {
  PutStatus    status = PutStatus::kInserted;
  RejectReason reason = RejectReason::kMalformed; // only meaningful when rejected
  uint64_t     evicted = 0;                       // bundles removed to make room

  static PutOutcome Inserted(uint64_t evicted = 0) {
    return {PutStatus::kInserted, RejectReason::kMalformed, evicted};
  }

  static PutOutcome Duplicate() {
    return {PutStatus::kDuplicateIgnored, RejectReason::kMalformed, 0};
  }

  static PutOutcome Rejected(RejectReason reason) {
    return {PutStatus::kRejected, reason, 0};
  }

  bool IsInserted() const {
    return status == PutStatus::kInserted;
  }
  bool IsDuplicate() const {
    return status == PutStatus::kDuplicateIgnored;
  }
  bool IsRejected() const {
    return status == PutStatus::kRejected;
  }
};

} // namespace courier::store
