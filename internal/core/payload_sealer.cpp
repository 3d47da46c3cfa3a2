#include "internal/core/payload_sealer.hpp"

#include <stdexcept>
#include <string_view>

#include "internal/util/errors.hpp"

namespace courier::core {

namespace {

std::span<const uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

} // namespace

PayloadSealer::PayloadSealer(std::shared_ptr<crypto::NodeIdentity> identity, std::shared_ptr<crypto::GroupKey> group_key,
                             std::shared_ptr<crypto::KeyDirectory> keys)
    : identity_(std::move(identity)), group_key_(std::move(group_key)), keys_(std::move(keys)) {
  if (!identity_ || !keys_) {
    throw std::invalid_argument("payload sealer requires an identity and a key directory");
  }
}

std::vector<uint8_t> PayloadSealer::Seal(const model::Destination& destination, model::Audience audience,
                                         std::span<const uint8_t> plaintext) const {
  switch (audience) {
    case model::Audience::kPublic:
      return {plaintext.begin(), plaintext.end()};

    case model::Audience::kTrusted: {
      if (!CanReadTrusted()) {
        throw util::InvalidArgument("no trusted group key configured");
      }
      const auto aad = destination.ToString();
      return group_key_->Seal(AsBytes(aad), plaintext);
    }

    case model::Audience::kDestinationOnly: {
      if (destination.scheme != model::Scheme::kNode) {
        throw util::InvalidArgument("destination-only bundles need a node:// destination");
      }
      std::optional<model::BoxPublicKey> recipient;
      if (destination.scope == identity_->NodeId()) {
        recipient = identity_->BoxKey();
      } else {
        recipient = keys_->Lookup(destination.scope);
      }
      if (!recipient) {
        throw util::InvalidArgument("no box key known for node " + destination.scope);
      }
      return identity_->EncryptFor(plaintext, *recipient);
    }
  }
  throw util::InvalidArgument("unknown audience");
}

std::vector<uint8_t> PayloadSealer::Open(const model::Bundle& bundle) const {
  switch (bundle.audience) {
    case model::Audience::kPublic:
      return bundle.payload;

    case model::Audience::kTrusted:
      if (!CanReadTrusted()) {
        throw util::AuthenticationError("trusted payload but no group key");
      }
      return group_key_->Open(AsBytes(bundle.destination), bundle.payload);

    case model::Audience::kDestinationOnly: {
      const auto destination = model::Destination::Parse(bundle.destination);
      if (!destination || destination->scheme != model::Scheme::kNode || destination->scope != identity_->NodeId()) {
        throw util::AuthenticationError("payload addressed to another node");
      }
      return identity_->DecryptFrom(bundle.payload, bundle.source_box_key);
    }
  }
  throw util::AuthenticationError("unknown audience");
}

} // namespace courier::core
