#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/bundle.hpp"

namespace courier::store {

class BundleStore;

struct PendingFilter {
  std::optional<std::string> topic;
  std::optional<std::string> destination;
};

/*
  Lazy, restartable walk over pending bundles in scheduler order.

  Pages are fetched on demand with a keyset query, so the cursor holds no
  lock between calls and sees bundles inserted after it was opened if they
  sort after the current position. Position() can be saved and handed to a
  new cursor to resume.
*/
class PendingCursor {
 public:
  PendingCursor(BundleStore& store, PendingFilter filter, uint64_t now_ms, std::size_t page_size,
                std::optional<db::BundleOrderKey> position = std::nullopt);

  std::optional<model::Bundle> Next();

  const std::optional<db::BundleOrderKey>& Position() const {
    return position_;
  }

 private:
  void Fill();

  BundleStore&                      store_;
  PendingFilter                     filter_;
  uint64_t                          now_ms_;
  std::size_t                       page_size_;
  std::optional<db::BundleOrderKey> position_;
  std::optional<db::BundleOrderKey> fetched_until_;
  std::deque<db::model::BundleRecord> page_;
  bool                              exhausted_ = false;
};

} // namespace courier::store
