#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/payload_sealer.hpp"
#include "internal/model/bundle.hpp"
#include "internal/store/bundle_store.hpp"

namespace courier::delivery {

/*
  One locally delivered bundle with its plaintext.
*/
struct Delivery {
  uint64_t             seq = 0;
  model::BundleId      id{};
  std::string          source; // node id of the creator
  std::string          destination;
  std::string          topic;
  model::Priority      priority      = model::Priority::kNormal;
  model::Audience      audience      = model::Audience::kPublic;
  uint64_t             created_at_ms = 0;
  uint64_t             delivered_at_ms = 0;
  std::vector<uint8_t> plaintext;
};

class DeliveryCursor;

/*
  Read side of local delivery.

  Deliveries are appended by the node with a monotonically increasing seq;
  consumers read after the last seq they processed, so a feed can be
  resumed after restart by persisting that number. Bundles that expired
  since delivery are not returned. Payloads this node cannot open are
  skipped and counted, never surfaced as errors.
*/
class DeliveryFeed {
 public:
  DeliveryFeed(std::shared_ptr<store::BundleStore> store, std::shared_ptr<const core::PayloadSealer> sealer);

  // Empty topic reads every topic.
  std::vector<Delivery> Read(const std::string& topic, uint64_t after_seq, std::size_t max, uint64_t now_ms);

  DeliveryCursor Cursor(std::string topic, uint64_t after_seq = 0, std::size_t page_size = 32);

  uint64_t Unreadable() const {
    return unreadable_.load();
  }

 private:
  std::optional<Delivery> Resolve(const db::model::DeliveryRecord& record, uint64_t now_ms);

  std::shared_ptr<store::BundleStore>        store_;
  std::shared_ptr<const core::PayloadSealer> sealer_;
  std::atomic<uint64_t>                      unreadable_{0};
};

/*
  Lazy iterator over a DeliveryFeed. Position() is the seq of the last
  delivery returned; a new cursor started there continues where this one
  stopped.
*/
class DeliveryCursor {
 public:
  std::optional<Delivery> Next(uint64_t now_ms);

  uint64_t Position() const {
    return position_;
  }

 private:
  friend class DeliveryFeed;

  DeliveryCursor(DeliveryFeed& feed, std::string topic, uint64_t after_seq, std::size_t page_size);

  DeliveryFeed&        feed_;
  std::string          topic_;
  uint64_t             position_;
  std::size_t          page_size_;
  std::deque<Delivery> buffer_;
};

} // namespace courier::delivery
