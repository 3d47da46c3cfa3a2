#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "internal/crypto/identity.hpp"
#include "internal/crypto/key_directory.hpp"
#include "internal/model/bundle.hpp"
#include "internal/model/destination.hpp"

namespace courier::core {

/*
  Seals and opens bundle payloads according to the audience:

    public            clear bytes; integrity comes from the bundle signature
    trusted           ChaCha20-Poly1305 under the group key, destination as AAD
    destination-only  X25519 box from this node to the node:// recipient
*/
class PayloadSealer {
 public:
  PayloadSealer(std::shared_ptr<crypto::NodeIdentity> identity, std::shared_ptr<crypto::GroupKey> group_key,
                std::shared_ptr<crypto::KeyDirectory> keys);

  // Throws util::InvalidArgument when the audience cannot be served (no
  // group key, non-node destination, unknown recipient box key).
  std::vector<uint8_t> Seal(const model::Destination& destination, model::Audience audience, std::span<const uint8_t> plaintext) const;

  // Throws util::AuthenticationError when this node cannot read the payload.
  std::vector<uint8_t> Open(const model::Bundle& bundle) const;

  bool CanReadTrusted() const {
    return group_key_ && group_key_->Available();
  }

 private:
  std::shared_ptr<crypto::NodeIdentity> identity_;
  std::shared_ptr<crypto::GroupKey>     group_key_;
  std::shared_ptr<crypto::KeyDirectory> keys_;
};

} // namespace courier::core
