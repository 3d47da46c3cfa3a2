#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

#include "internal/codec/bundle_codec.hpp"
#include "internal/core/payload_sealer.hpp"
#include "internal/crypto/identity.hpp"
#include "internal/crypto/key_directory.hpp"
#include "internal/delivery/delivery_feed.hpp"
#include "internal/observability/bundle_counters.hpp"
#include "internal/propagation/exchange_host.hpp"
#include "internal/propagation/propagation_worker.hpp"
#include "internal/reaper/expiry_reaper.hpp"
#include "internal/store/bundle_store.hpp"

namespace courier::core {

inline constexpr uint16_t kDefaultHopLimit = 30;

struct NodeOptions {
  std::vector<std::string> subscriptions;
  std::vector<std::string> trusted_peers; // node ids

  std::chrono::milliseconds default_ttl{std::chrono::hours(24)};
  uint16_t                  default_hop_limit = kDefaultHopLimit;
  std::size_t               max_payload_bytes = codec::kMaxPayloadBytes;

  // Relay bundles for any topic, not only subscribed ones.
  bool relay_all = true;

  propagation::SessionOptions session;
  std::chrono::milliseconds   shutdown_grace{std::chrono::seconds(5)};
};

struct SubmitRequest {
  std::string          destination;
  std::string          topic;
  std::vector<uint8_t> plaintext;
  model::Priority      priority = model::Priority::kNormal;
  model::Audience      audience = model::Audience::kPublic;

  std::chrono::milliseconds ttl{0};  // 0 = node default
  uint16_t                  hop_limit = 0; // 0 = node default
  bool                      custody_requested = false;
};

struct NodeHealth {
  bool     serving            = false;
  bool     identity_available = false;
  bool     trusted_group_loaded = false;
  bool     store_failed       = false;
  uint64_t active_neighbors   = 0;
};

struct NodeStats {
  store::StoreStats                             store;
  std::vector<observability::BundleCounters::Entry> counters;
  uint64_t                                      active_neighbors   = 0;
  uint64_t                                      suspect_signatures = 0;
  uint64_t                                      unreadable_payloads = 0;
};

/*
  CourierNode

  Owns one node's bundle core: the store, the reaper, the propagation
  workers and the delivery feed. Implements the producer interface
  (Submit) and, as the ExchangeHost, everything a neighbor session needs.

  Local delivery: a bundle is delivered here when it is addressed to this
  node (node://<own id>/...) or when this node subscribes to its topic
  (topic:// and trusted://). Bundles created here are not delivered to
  ourselves.

  Custody: a node that stores a custody-requested bundle holds custody of
  it. When such a bundle reaches its node:// destination, the destination
  emits a custody-ack bundle back to the origin; every node that stores
  the ack marks the acknowledged bundle so it is no longer forwarded and is
  evicted first.
*/
class CourierNode final : public propagation::ExchangeHost {
 public:
  CourierNode(std::shared_ptr<crypto::NodeIdentity> identity, std::shared_ptr<crypto::GroupKey> group_key,
              std::shared_ptr<crypto::KeyDirectory> keys, std::shared_ptr<store::BundleStore> store,
              std::shared_ptr<reaper::ExpiryReaper> reaper, std::shared_ptr<observability::BundleCounters> counters, NodeOptions options);
  ~CourierNode() override;

  CourierNode(const CourierNode&)            = delete;
  CourierNode& operator=(const CourierNode&) = delete;

  void Start();
  void Stop();

  // -------------------------------------------------------------------------
  // Producer / consumer
  // -------------------------------------------------------------------------

  // Seals, signs and stores a new bundle. Throws util::InvalidArgument for a
  // request that can never be accepted, util::ResourceExhausted when the
  // store is full and util::InvalidState after a wipe.
  model::BundleId Submit(const SubmitRequest& request, uint64_t now_ms);

  delivery::DeliveryFeed& Deliveries() {
    return *feed_;
  }

  // -------------------------------------------------------------------------
  // Neighbors
  // -------------------------------------------------------------------------

  // Spawns a propagation worker for a freshly discovered neighbor link.
  void Connect(std::shared_ptr<propagation::NeighborLink> link);

  void Subscribe(const std::string& topic);
  void Unsubscribe(const std::string& topic);
  std::vector<std::string> Subscriptions() const;

  void TrustPeer(const std::string& node_id);
  bool IsTrusted(const std::string& node_id) const;

  bool IsLocalDestination(const model::Bundle& bundle) const;

  // -------------------------------------------------------------------------
  // Operations
  // -------------------------------------------------------------------------

  // Emergency wipe: stops propagation, secure-erases the identity and group
  // key (memory and files) and optionally purges every stored bundle.
  // Returns the number of bundles purged.
  uint64_t Wipe(bool purge_store);

  NodeHealth Health();
  NodeStats  Stats();

  std::string NodeId() const {
    return identity_->NodeId();
  }

  const std::shared_ptr<store::BundleStore>& Store() const {
    return store_;
  }

  // -------------------------------------------------------------------------
  // propagation::ExchangeHost
  // -------------------------------------------------------------------------

  codec::HelloFrame             LocalHello() override;
  propagation::NeighborInfo     AcceptHello(const codec::HelloFrame& hello) override;
  void                          BeforeRound(uint64_t now_ms) override;
  std::vector<model::BundleId>  Manifest(const propagation::NeighborInfo& neighbor, uint64_t now_ms) override;
  std::vector<model::BundleId>  Missing(const std::vector<model::BundleId>& offered) override;
  std::optional<std::vector<uint8_t>> Serve(const model::BundleId& id, const propagation::NeighborInfo& neighbor, uint64_t now_ms) override;
  propagation::IngestOutcome    Ingest(std::span<const uint8_t> wire, const propagation::NeighborInfo& neighbor, uint64_t now_ms) override;
  void OnReceipt(const model::BundleId& id, codec::ReceiptStatus status, const propagation::NeighborInfo& neighbor, uint64_t now_ms) override;
  void OnUnreceipted(const model::BundleId& id, const propagation::NeighborInfo& neighbor, uint64_t now_ms) override;

 private:
  model::Bundle SignedBundle(model::Bundle bundle) const;

  bool Relevant(const scheduler::QueueEntry& entry, const propagation::NeighborInfo& neighbor) const;

  void Deliver(const model::Bundle& bundle, uint64_t now_ms);
  void EmitCustodyAck(const model::Bundle& delivered, uint64_t now_ms);
  void ApplyCustodyAck(const model::Bundle& ack);

  void StopWorkers(std::chrono::milliseconds grace);
  void PruneWorkers();

  std::shared_ptr<crypto::NodeIdentity>          identity_;
  std::shared_ptr<crypto::GroupKey>              group_key_;
  std::shared_ptr<crypto::KeyDirectory>          keys_;
  std::shared_ptr<store::BundleStore>            store_;
  std::shared_ptr<reaper::ExpiryReaper>          reaper_;
  std::shared_ptr<observability::BundleCounters> counters_;
  NodeOptions                                    options_;

  std::shared_ptr<PayloadSealer>          sealer_;
  std::unique_ptr<delivery::DeliveryFeed> feed_;

  mutable std::shared_mutex peers_mutex_;
  std::set<std::string>     subscriptions_;
  std::set<std::string>     trusted_peers_;

  std::mutex                                              workers_mutex_;
  std::vector<std::unique_ptr<propagation::PropagationWorker>> workers_;
  std::atomic<uint64_t>                                   suspect_signatures_{0};

  std::atomic<bool> started_{false};
};

} // namespace courier::core
