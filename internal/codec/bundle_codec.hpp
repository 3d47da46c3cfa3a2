#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "internal/model/bundle.hpp"

namespace courier::codec {

inline constexpr std::size_t kMaxDestinationLength = 512;
inline constexpr std::size_t kMaxTopicLength       = 128;
inline constexpr std::size_t kMaxPayloadBytes      = 4 * 1024 * 1024;

/*
  Bundle wire format (big-endian, fixed order):

    version u8 | id[32] | source[32] | source_box_key[32]
    | destination (u16 len) | topic (u16 len)
    | priority u8 | audience u8 | flags u8
    | created_at_ms u64 | ttl_ms u64
    | hop_limit u16 | hop_count u16
    | signature[64] | payload (u32 len)

  Encoding is canonical: equal bundles give equal bytes.
*/
std::vector<uint8_t> Encode(const model::Bundle& bundle);

// Throws util::DecodeError; never returns a partially populated bundle.
model::Bundle Decode(std::span<const uint8_t> bytes);

// Canonical bytes of the immutable fields; both the id and the signature
// are computed over this. hop_count and signature are excluded.
std::vector<uint8_t> IdPreimage(const model::Bundle& bundle);

model::BundleId ComputeId(const model::Bundle& bundle);

} // namespace courier::codec
