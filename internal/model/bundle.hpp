#pragma once

#include <array>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace courier::model {

inline constexpr std::uint8_t kBundleVersion = 1;

inline constexpr std::size_t kBundleIdSize     = 32;
inline constexpr std::size_t kSigningKeySize   = 32;
inline constexpr std::size_t kBoxKeySize       = 32;
inline constexpr std::size_t kSignatureSize    = 64;

using Bytes            = std::vector<std::uint8_t>;
using BundleId         = std::array<std::uint8_t, kBundleIdSize>;
using SigningPublicKey = std::array<std::uint8_t, kSigningKeySize>;
using BoxPublicKey     = std::array<std::uint8_t, kBoxKeySize>;
using Signature        = std::array<std::uint8_t, kSignatureSize>;

// Lower value wins. Wire and storage use the numeric value.
enum class Priority : std::uint8_t {
  kEmergency = 0,
  kExpedited = 1,
  kNormal    = 2,
  kBulk      = 3,
};

enum class Audience : std::uint8_t {
  kPublic          = 0,
  kTrusted         = 1,
  kDestinationOnly = 2,
};

enum class CustodyState : std::uint8_t {
  kNone         = 0,
  kHeld         = 1,
  kAcknowledged = 2,
};

inline constexpr std::uint8_t kFlagCustodyRequested = 0x01;
inline constexpr std::uint8_t kFlagCustodyAck       = 0x02;
inline constexpr std::uint8_t kKnownFlags           = kFlagCustodyRequested | kFlagCustodyAck;

inline constexpr std::string_view kCustodyAckTopic       = "custody-acks";
inline constexpr std::string_view kTrustRevocationsTopic = "trust-revocations";

/*
  Bundle

  Everything except hop_count and signature is immutable once the id has
  been computed. The id is SHA-256 over the canonical pre-image of those
  immutable fields, and the signature is made over the same pre-image.
*/
struct Bundle {
  std::uint8_t     version = kBundleVersion;
  BundleId         id{};
  SigningPublicKey source{};
  BoxPublicKey     source_box_key{};
  std::string      destination;
  std::string      topic;
  Priority         priority          = Priority::kNormal;
  Audience         audience          = Audience::kPublic;
  bool             custody_requested = false;
  bool             custody_ack       = false;
  std::uint64_t    created_at_ms     = 0;
  std::uint64_t    ttl_ms            = 0;
  std::uint16_t    hop_limit         = 0;
  std::uint16_t    hop_count         = 0;
  Signature        signature{};
  Bytes            payload;

  std::uint64_t ExpiresAtMs() const {
    if (ttl_ms > std::numeric_limits<std::uint64_t>::max() - created_at_ms) {
      return std::numeric_limits<std::uint64_t>::max();
    }
    return created_at_ms + ttl_ms;
  }

  bool IsExpired(std::uint64_t now_ms) const {
    return now_ms > ExpiresAtMs();
  }

  bool Forwardable() const {
    return hop_count < hop_limit;
  }

  std::uint8_t Flags() const {
    return static_cast<std::uint8_t>((custody_requested ? kFlagCustodyRequested : 0) | (custody_ack ? kFlagCustodyAck : 0));
  }

  bool operator==(const Bundle&) const = default;
};

std::string_view ToString(Priority priority);
std::string_view ToString(Audience audience);
std::string_view ToString(CustodyState state);

std::optional<Priority> ParsePriority(std::string_view value);
std::optional<Audience> ParseAudience(std::string_view value);

// Hex of the Ed25519 public key; doubles as the node:// scope.
std::string NodeIdOf(const SigningPublicKey& key);
std::string IdToHex(const BundleId& id);
std::optional<BundleId> IdFromHex(std::string_view hex);

} // namespace courier::model
