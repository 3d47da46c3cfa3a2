#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "internal/crypto/secret_key.hpp"
#include "internal/model/bundle.hpp"

namespace courier::crypto {

/*
  Authenticated public-key box.

  Static-static X25519 between sender and recipient, HKDF-SHA256 keyed with
  both public keys, ChaCha20-Poly1305 for confidentiality and integrity.
  Only the holder of either private key can open the box, and a successful
  open proves the sender held the sender private key.

  Layout: nonce(12) || ciphertext || tag(16)
*/

struct BoxKeyPair {
  model::BoxPublicKey public_key{};
  SecretKey           secret; // 32-byte raw X25519 private key
};

BoxKeyPair GenerateBoxKeyPair();
BoxKeyPair BoxKeyPairFromSecret(SecretKey secret);

std::vector<uint8_t> EncryptFor(std::span<const uint8_t> plaintext, const model::BoxPublicKey& recipient_public, const SecretKey& sender_secret);

// Throws util::AuthenticationError if the box was not made by sender for us.
std::vector<uint8_t> DecryptFrom(std::span<const uint8_t> ciphertext, const model::BoxPublicKey& sender_public, const SecretKey& recipient_secret);

} // namespace courier::crypto
