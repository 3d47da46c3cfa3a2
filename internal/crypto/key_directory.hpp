#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "internal/model/bundle.hpp"

namespace courier::crypto {

/*
  node id -> X25519 box key, needed to seal destination-only payloads.

  Seeded from configured known peers and extended from verified HELLO
  frames. Thread-safe.
*/
class KeyDirectory {
 public:
  void Learn(const std::string& node_id, const model::BoxPublicKey& box_key);

  std::optional<model::BoxPublicKey> Lookup(const std::string& node_id) const;

  std::size_t Size() const;

  void Clear();

 private:
  mutable std::shared_mutex                            mutex_;
  std::unordered_map<std::string, model::BoxPublicKey> keys_;
};

} // namespace courier::crypto
