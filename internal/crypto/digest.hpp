#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace courier::crypto {

using Sha256Digest = std::array<uint8_t, 32>;

Sha256Digest Sha256(std::span<const uint8_t> data);

// CSPRNG fill; throws util::CryptoError if the generator fails.
void RandomFill(std::span<uint8_t> out);

} // namespace courier::crypto
