#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include <openssl/evp.h>

namespace courier::crypto {

inline constexpr std::size_t kAeadKeySize   = 32;
inline constexpr std::size_t kAeadNonceSize = 12;
inline constexpr std::size_t kAeadTagSize   = 16;

/*
  AEAD primitives shared by the bundle box, the trusted group cipher and the
  local secret box. Seal returns ciphertext || tag; Open throws
  util::AuthenticationError when the tag does not verify.
*/
std::vector<uint8_t> AeadSeal(const EVP_CIPHER* cipher, std::span<const uint8_t> key, std::span<const uint8_t> nonce, std::span<const uint8_t> aad,
                              std::span<const uint8_t> plaintext);

std::vector<uint8_t> AeadOpen(const EVP_CIPHER* cipher, std::span<const uint8_t> key, std::span<const uint8_t> nonce, std::span<const uint8_t> aad,
                              std::span<const uint8_t> ciphertext_and_tag);

// ChaCha20-Poly1305 with a fresh random nonce: nonce || ciphertext || tag.
std::vector<uint8_t> ChaChaSeal(std::span<const uint8_t> key, std::span<const uint8_t> aad, std::span<const uint8_t> plaintext);
std::vector<uint8_t> ChaChaOpen(std::span<const uint8_t> key, std::span<const uint8_t> aad, std::span<const uint8_t> sealed);

} // namespace courier::crypto
