#pragma once

#include <cstdint>
#include <span>

#include "internal/crypto/secret_key.hpp"
#include "internal/model/bundle.hpp"

namespace courier::crypto {

/*
  Ed25519 signing identity.
*/
struct SigningKeyPair {
  model::SigningPublicKey public_key{};
  SecretKey               secret; // 32-byte raw private key
};

SigningKeyPair GenerateSigningKeyPair();

// Rebuilds the public half from a raw 32-byte private key.
SigningKeyPair SigningKeyPairFromSecret(SecretKey secret);

model::Signature Sign(std::span<const uint8_t> message, const SecretKey& signing_key);

// False on any mismatch; never throws for a bad signature.
bool Verify(std::span<const uint8_t> message, const model::Signature& signature, const model::SigningPublicKey& public_key);

} // namespace courier::crypto
