#include "internal/delivery/delivery_feed.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace courier::delivery {

DeliveryFeed::DeliveryFeed(std::shared_ptr<store::BundleStore> store, std::shared_ptr<const core::PayloadSealer> sealer)
    : store_(std::move(store)), sealer_(std::move(sealer)) {
  if (!store_ || !sealer_) {
    throw std::invalid_argument("delivery feed requires a store and a sealer");
  }
}

std::optional<Delivery> DeliveryFeed::Resolve(const db::model::DeliveryRecord& record, uint64_t now_ms) {
  const auto id = model::IdFromHex(record.bundle_id);
  if (!id) return std::nullopt;

  auto bundle = store_->Find(*id);
  if (!bundle || bundle->IsExpired(now_ms)) return std::nullopt;

  Delivery out;
  try {
    out.plaintext = sealer_->Open(*bundle);
  } catch (const util::AuthenticationError& e) {
    ++unreadable_;
    COURIER_LOG_DEBUG("delivered payload unreadable", {observability::IdField("bundle_id", record.bundle_id), observability::StringField("topic", record.topic),
                                                       observability::StringField("error", e.what())});
    return std::nullopt;
  }

  out.seq             = record.seq;
  out.id              = bundle->id;
  out.source          = model::NodeIdOf(bundle->source);
  out.destination     = bundle->destination;
  out.topic           = bundle->topic;
  out.priority        = bundle->priority;
  out.audience        = bundle->audience;
  out.created_at_ms   = bundle->created_at_ms;
  out.delivered_at_ms = record.delivered_at_ms;
  return out;
}

std::vector<Delivery> DeliveryFeed::Read(const std::string& topic, uint64_t after_seq, std::size_t max, uint64_t now_ms) {
  std::vector<Delivery> out;
  if (max == 0) return out;

  uint64_t position = after_seq;
  while (out.size() < max) {
    const auto page = store_->ReadDeliveries(topic, position, max - out.size());
    if (page.empty()) break;

    for (const auto& record : page) {
      position = record.seq;
      if (auto delivery = Resolve(record, now_ms)) {
        out.push_back(std::move(*delivery));
      }
    }
  }
  return out;
}

DeliveryCursor DeliveryFeed::Cursor(std::string topic, uint64_t after_seq, std::size_t page_size) {
  return DeliveryCursor(*this, std::move(topic), after_seq, page_size == 0 ? 1 : page_size);
}

// ---------------------------------------------------------------------------
// DeliveryCursor
// ---------------------------------------------------------------------------

DeliveryCursor::DeliveryCursor(DeliveryFeed& feed, std::string topic, uint64_t after_seq, std::size_t page_size)
    : feed_(feed), topic_(std::move(topic)), position_(after_seq), page_size_(page_size) {
}

std::optional<Delivery> DeliveryCursor::Next(uint64_t now_ms) {
  if (buffer_.empty()) {
    const auto after = position_;
    for (auto& d : feed_.Read(topic_, after, page_size_, now_ms)) {
      buffer_.push_back(std::move(d));
    }
  }
  if (buffer_.empty()) return std::nullopt;

  auto next = std::move(buffer_.front());
  buffer_.pop_front();
  position_ = next.seq;
  return next;
}

} // namespace courier::delivery
