#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace courier::model {

/*
  Logical bundle address: scheme://scope/topic

    node://<node-id>/<topic>     unicast to one node
    topic://<scope>/<topic>      multicast to subscribers of topic
    trusted://<scope>/<topic>    broadcast to the trusted audience
*/
enum class Scheme {
  kNode,
  kTopic,
  kTrusted,
};

struct Destination {
  Scheme      scheme = Scheme::kTopic;
  std::string scope;
  std::string topic;

  static std::optional<Destination> Parse(std::string_view text);

  std::string ToString() const;

  bool operator==(const Destination&) const = default;
};

} // namespace courier::model
