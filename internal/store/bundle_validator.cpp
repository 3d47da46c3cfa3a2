#include "internal/store/bundle_validator.hpp"

#include "internal/codec/bundle_codec.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/model/destination.hpp"

namespace courier::store {

std::string_view ToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kMalformed:
      return "malformed";
    case RejectReason::kSignatureInvalid:
      return "signature_invalid";
    case RejectReason::kExpired:
      return "expired";
    case RejectReason::kHopLimitExceeded:
      return "hop_limit_exceeded";
    case RejectReason::kStorageFull:
      return "storage_full";
  }
  return "unknown";
}

bool BundleValidator::VerifyIntegrity(const model::Bundle& bundle) {
  if (codec::ComputeId(bundle) != bundle.id) {
    return false;
  }
  return crypto::Verify(codec::IdPreimage(bundle), bundle.signature, bundle.source);
}

std::optional<RejectReason> BundleValidator::Validate(const model::Bundle& bundle, uint64_t now_ms, bool local_destination) {
  if (bundle.version != model::kBundleVersion || bundle.hop_limit == 0 || bundle.ttl_ms == 0) {
    return RejectReason::kMalformed;
  }
  auto destination = model::Destination::Parse(bundle.destination);
  if (!destination || destination->topic != bundle.topic) {
    return RejectReason::kMalformed;
  }

  if (!VerifyIntegrity(bundle)) {
    return RejectReason::kSignatureInvalid;
  }

  if (bundle.IsExpired(now_ms)) {
    return RejectReason::kExpired;
  }

  if (bundle.hop_count > bundle.hop_limit) {
    return RejectReason::kHopLimitExceeded;
  }
  if (bundle.hop_count == bundle.hop_limit && !local_destination) {
    return RejectReason::kHopLimitExceeded;
  }

  return std::nullopt;
}

} // namespace courier::store
