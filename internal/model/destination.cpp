#include "destination.hpp"

namespace courier::model {

namespace {

bool ValidSegment(std::string_view segment) {
  if (segment.empty()) {
    return false;
  }
  for (char c : segment) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace

std::optional<Destination> Destination::Parse(std::string_view text) {
  const auto sep = text.find("://");
  if (sep == std::string_view::npos) {
    return std::nullopt;
  }

  Destination out;
  const auto  scheme = text.substr(0, sep);
  if (scheme == "node") {
    out.scheme = Scheme::kNode;
  } else if (scheme == "topic") {
    out.scheme = Scheme::kTopic;
  } else if (scheme == "trusted") {
    out.scheme = Scheme::kTrusted;
  } else {
    return std::nullopt;
  }

  const auto rest  = text.substr(sep + 3);
  const auto slash = rest.find('/');
  if (slash == std::string_view::npos) {
    return std::nullopt;
  }

  const auto scope = rest.substr(0, slash);
  const auto topic = rest.substr(slash + 1);
  if (!ValidSegment(scope) || !ValidSegment(topic)) {
    return std::nullopt;
  }

  out.scope = std::string(scope);
  out.topic = std::string(topic);
  return out;
}

std::string Destination::ToString() const {
  std::string prefix;
  switch (scheme) {
    case Scheme::kNode:
      prefix = "node://";
      break;
    case Scheme::kTopic:
      prefix = "topic://";
      break;
    case Scheme::kTrusted:
      prefix = "trusted://";
      break;
  }
  return prefix + scope + "/" + topic;
}

} // namespace courier::model
