#include "internal/store/pending_cursor.hpp"

#include "internal/codec/bundle_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/bundle_store.hpp"
#include "internal/util/errors.hpp"

namespace courier::store {

PendingCursor::PendingCursor(BundleStore& store, PendingFilter filter, uint64_t now_ms, std::size_t page_size,
                             std::optional<db::BundleOrderKey> position)
    : store_(store),
      filter_(std::move(filter)),
      now_ms_(now_ms),
      page_size_(page_size == 0 ? 64 : page_size),
      position_(position),
      fetched_until_(std::move(position)) {
}

void PendingCursor::Fill() {
  if (exhausted_ || !page_.empty()) return;

  auto rows = store_.FetchPendingPage(filter_, now_ms_, fetched_until_, page_size_);
  if (rows.size() < page_size_) exhausted_ = true;
  if (!rows.empty()) fetched_until_ = db::OrderKeyOf(rows.back());
  for (auto& row : rows) {
    page_.push_back(std::move(row));
  }
}

std::optional<model::Bundle> PendingCursor::Next() {
  while (true) {
    Fill();
    if (page_.empty()) return std::nullopt;

    auto row = std::move(page_.front());
    page_.pop_front();
    position_ = db::OrderKeyOf(row);

    try {
      return codec::Decode(row.wire);
    } catch (const util::DecodeError& e) {
      // left for Revalidate to remove
      COURIER_LOG_WARN("stored bundle failed to decode", {observability::IdField("bundle_id", row.id), observability::StringField("error", e.what())});
    }
  }
}

} // namespace courier::store
