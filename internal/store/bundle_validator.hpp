#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/bundle.hpp"
#include "internal/store/put_outcome.hpp"

namespace courier::store {

/*
  A bundle is valid when:
    - its id is the digest of its immutable fields
    - the source signature over those fields verifies
    - it has not expired
    - hop_count < hop_limit, or hop_count == hop_limit when the bundle is
      for local delivery

  Runs before any write. Pure apart from the clock value passed in.
*/
class BundleValidator {
 public:
  static std::optional<RejectReason> Validate(const model::Bundle& bundle, uint64_t now_ms, bool local_destination);

  // Id and signature only; used when re-checking stored copies.
  static bool VerifyIntegrity(const model::Bundle& bundle);
};

} // namespace courier::store
