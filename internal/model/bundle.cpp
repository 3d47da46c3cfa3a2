#include "bundle.hpp"

#include <algorithm>

#include "internal/util/hex.hpp"

namespace courier::model {

std::string_view ToString(Priority priority) {
  switch (priority) {
    case Priority::kEmergency:
      return "emergency";
    case Priority::kExpedited:
      return "expedited";
    case Priority::kNormal:
      return "normal";
    case Priority::kBulk:
      return "bulk";
  }
  return "unknown";
}

std::string_view ToString(Audience audience) {
  switch (audience) {
    case Audience::kPublic:
      return "public";
    case Audience::kTrusted:
      return "trusted";
    case Audience::kDestinationOnly:
      return "destination-only";
  }
  return "unknown";
}

std::string_view ToString(CustodyState state) {
  switch (state) {
    case CustodyState::kNone:
      return "none";
    case CustodyState::kHeld:
      return "held";
    case CustodyState::kAcknowledged:
      return "acknowledged";
  }
  return "unknown";
}

std::optional<Priority> ParsePriority(std::string_view value) {
  if (value == "emergency") return Priority::kEmergency;
  if (value == "expedited") return Priority::kExpedited;
  if (value == "normal") return Priority::kNormal;
  if (value == "bulk") return Priority::kBulk;
  return std::nullopt;
}

std::optional<Audience> ParseAudience(std::string_view value) {
  if (value == "public") return Audience::kPublic;
  if (value == "trusted") return Audience::kTrusted;
  if (value == "destination-only") return Audience::kDestinationOnly;
  return std::nullopt;
}

std::string NodeIdOf(const SigningPublicKey& key) {
  return util::ToHex(key);
}

std::string IdToHex(const BundleId& id) {
  return util::ToHex(id);
}

std::optional<BundleId> IdFromHex(std::string_view hex) {
  auto bytes = util::FromHex(hex);
  if (!bytes || bytes->size() != kBundleIdSize) {
    return std::nullopt;
  }
  BundleId id{};
  std::copy(bytes->begin(), bytes->end(), id.begin());
  return id;
}

} // namespace courier::model
