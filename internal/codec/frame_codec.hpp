#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

#include "internal/model/bundle.hpp"

namespace courier::codec {

inline constexpr uint8_t     kProtocolVersion       = 1;
inline constexpr std::size_t kDefaultMaxFrameBytes  = 1024 * 1024;
// Room for a bundle frame with the longest destination and topic.
inline constexpr std::size_t kMinFrameBytes         = 1024;
inline constexpr std::size_t kMaxHelloSubscriptions = 256;

enum class FrameType : uint8_t {
  kHello    = 1,
  kManifest = 2,
  kRequest  = 3,
  kBundle   = 4,
  kReceipt  = 5,
  kEnd      = 6,
};

/*
  Neighbor exchange frames. Every frame is: type u8 | body.
  The HELLO body starts with the protocol version so a peer speaking a
  different version can be detected before the rest is parsed.
*/

struct HelloFrame {
  uint8_t                  protocol_version = kProtocolVersion;
  model::SigningPublicKey  signing_key{};
  model::BoxPublicKey      box_key{};
  bool                     relay_all = true;
  std::vector<std::string> subscriptions;
  model::Signature         signature{}; // over HelloPreimage
};

struct ManifestFrame {
  std::vector<model::BundleId> ids;
};

struct RequestFrame {
  std::vector<model::BundleId> ids;
};

struct BundleFrame {
  std::vector<uint8_t> wire;
};

enum class ReceiptStatus : uint8_t {
  kStored          = 0,
  kCustodyAccepted = 1,
  kDuplicate       = 2,
  kRejected        = 3,
};

struct ReceiptFrame {
  model::BundleId id{};
  ReceiptStatus   status = ReceiptStatus::kStored;
};

// Marks the end of the bundles served for one REQUEST.
struct EndFrame {};

using Frame = std::variant<HelloFrame, ManifestFrame, RequestFrame, BundleFrame, ReceiptFrame, EndFrame>;

std::vector<uint8_t> EncodeFrame(const Frame& frame);

// Throws util::DecodeError.
Frame DecodeFrame(std::span<const uint8_t> bytes, std::size_t max_frame_bytes = kDefaultMaxFrameBytes);

// Protocol version of a HELLO frame, nullopt for any other frame.
std::optional<uint8_t> PeekHelloVersion(std::span<const uint8_t> bytes);

std::vector<uint8_t> HelloPreimage(const HelloFrame& hello);

} // namespace courier::codec
