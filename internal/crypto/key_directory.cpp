#include "key_directory.hpp"

#include <mutex>

namespace courier::crypto {

void KeyDirectory::Learn(const std::string& node_id, const model::BoxPublicKey& box_key) {
  std::unique_lock lock(mutex_);
  keys_[node_id] = box_key;
}

std::optional<model::BoxPublicKey> KeyDirectory::Lookup(const std::string& node_id) const {
  std::shared_lock lock(mutex_);
  auto             it = keys_.find(node_id);
  if (it == keys_.end()) return std::nullopt;
  return it->second;
}

std::size_t KeyDirectory::Size() const {
  std::shared_lock lock(mutex_);
  return keys_.size();
}

void KeyDirectory::Clear() {
  std::unique_lock lock(mutex_);
  keys_.clear();
}

} // namespace courier::crypto
