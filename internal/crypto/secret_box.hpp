#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "internal/crypto/secret_key.hpp"

namespace courier::crypto {

/*
  Local secret box for material that never leaves the node (identity keys,
  the trusted group key, recovery phrases).

  Password-derived key via scrypt, AES-256-GCM for sealing. This is a
  separate format from the bundle box and the two are never interchanged.

  Layout:
    "CSB1" | log2(N) u8 | r u32 | p u32 | salt(16) | nonce(12) | ciphertext | tag(16)
  The header up to and including the salt is bound as AAD.
*/

struct ScryptParams {
  uint8_t  log2_n = 15;
  uint32_t r      = 8;
  uint32_t p      = 1;
};

std::vector<uint8_t> SealSecret(std::span<const uint8_t> plaintext, std::string_view passphrase, const ScryptParams& params = {});

// Throws util::AuthenticationError on a wrong passphrase or tampering and
// util::DecodeError on a malformed header.
SecretKey OpenSecret(std::span<const uint8_t> sealed, std::string_view passphrase);

} // namespace courier::crypto
