#include "internal/core/courier_node.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "internal/codec/bundle_codec.hpp"
#include "internal/model/destination.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/scheduler/priority_scheduler.hpp"
#include "internal/store/bundle_validator.hpp"
#include "internal/util/errors.hpp"

namespace courier::core {

using observability::BundleEvent;
using propagation::IngestOutcome;
using propagation::IngestStatus;
using propagation::NeighborInfo;

CourierNode::CourierNode(std::shared_ptr<crypto::NodeIdentity> identity, std::shared_ptr<crypto::GroupKey> group_key,
                         std::shared_ptr<crypto::KeyDirectory> keys, std::shared_ptr<store::BundleStore> store,
                         std::shared_ptr<reaper::ExpiryReaper> reaper, std::shared_ptr<observability::BundleCounters> counters,
                         NodeOptions options)
    : identity_(std::move(identity)),
      group_key_(std::move(group_key)),
      keys_(std::move(keys)),
      store_(std::move(store)),
      reaper_(std::move(reaper)),
      counters_(std::move(counters)),
      options_(std::move(options)) {
  if (!identity_ || !store_) {
    throw std::invalid_argument("courier node requires an identity and a store");
  }
  if (!keys_) keys_ = std::make_shared<crypto::KeyDirectory>();
  if (!counters_) counters_ = std::make_shared<observability::BundleCounters>();
  if (options_.default_hop_limit == 0) options_.default_hop_limit = kDefaultHopLimit;
  if (options_.default_ttl.count() <= 0) options_.default_ttl = std::chrono::hours(24);
  if (options_.max_payload_bytes == 0 || options_.max_payload_bytes > codec::kMaxPayloadBytes) options_.max_payload_bytes = codec::kMaxPayloadBytes;

  sealer_ = std::make_shared<PayloadSealer>(identity_, group_key_, keys_);
  feed_   = std::make_unique<delivery::DeliveryFeed>(store_, sealer_);

  subscriptions_.insert(options_.subscriptions.begin(), options_.subscriptions.end());
  trusted_peers_.insert(options_.trusted_peers.begin(), options_.trusted_peers.end());
}

CourierNode::~CourierNode() {
  Stop();
}

void CourierNode::Start() {
  if (started_.exchange(true)) return;
  if (reaper_) reaper_->Start();
  COURIER_LOG_INFO("courier node started", {observability::IdField("node_id", identity_->NodeId()),
                                            observability::IntField("subscriptions", static_cast<int64_t>(Subscriptions().size()))});
}

void CourierNode::Stop() {
  if (!started_.exchange(false)) {
    StopWorkers(std::chrono::milliseconds(0));
    return;
  }
  StopWorkers(options_.shutdown_grace);
  if (reaper_) reaper_->Stop();
  COURIER_LOG_INFO("courier node stopped");
}

// ---------------------------------------------------------------------------
// Submit
// ---------------------------------------------------------------------------

model::Bundle CourierNode::SignedBundle(model::Bundle bundle) const {
  bundle.source         = identity_->SigningKey();
  bundle.source_box_key = identity_->BoxKey();
  bundle.id             = codec::ComputeId(bundle);
  bundle.signature      = identity_->Sign(codec::IdPreimage(bundle));
  return bundle;
}

model::BundleId CourierNode::Submit(const SubmitRequest& request, uint64_t now_ms) {
  observability::SpanScope span("node.submit");

  const auto destination = model::Destination::Parse(request.destination);
  if (!destination) {
    throw util::InvalidArgument("invalid destination: " + request.destination);
  }
  const auto topic = request.topic.empty() ? destination->topic : request.topic;
  if (topic != destination->topic) {
    throw util::InvalidArgument("topic does not match destination");
  }
  if (topic.size() > codec::kMaxTopicLength || request.destination.size() > codec::kMaxDestinationLength) {
    throw util::InvalidArgument("destination too long");
  }
  if (request.plaintext.size() > options_.max_payload_bytes) {
    throw util::InvalidArgument("payload too large");
  }
  if (request.ttl.count() < 0) {
    throw util::InvalidArgument("ttl must not be negative");
  }
  if (!identity_->Available()) {
    throw util::InvalidState("node identity has been wiped");
  }

  model::Bundle bundle;
  bundle.destination       = destination->ToString();
  bundle.topic             = topic;
  bundle.priority          = request.priority;
  bundle.audience          = request.audience;
  bundle.custody_requested = request.custody_requested;
  bundle.created_at_ms     = now_ms;
  bundle.ttl_ms            = static_cast<uint64_t>(request.ttl.count() > 0 ? request.ttl.count() : options_.default_ttl.count());
  bundle.hop_limit         = request.hop_limit > 0 ? request.hop_limit : options_.default_hop_limit;
  bundle.payload           = sealer_->Seal(*destination, request.audience, request.plaintext);

  if (bundle.payload.size() > codec::kMaxPayloadBytes) {
    throw util::InvalidArgument("payload too large");
  }

  bundle = SignedBundle(std::move(bundle));
  const auto hex = model::IdToHex(bundle.id);
  span.SetBundle(hex);

  const auto outcome = store_->Put(bundle, now_ms, store::PutOptions{.local_destination = false, .hold_custody = true});
  if (outcome.IsRejected()) {
    if (outcome.reason == store::RejectReason::kStorageFull) {
      throw util::ResourceExhausted("bundle store is full");
    }
    throw util::InvalidArgument(std::string("bundle rejected: ") + std::string(store::ToString(outcome.reason)));
  }

  if (outcome.IsInserted()) {
    counters_->Record(BundleEvent::kCreated, bundle.priority, bundle.topic);
    COURIER_LOG_INFO("bundle created", {observability::IdField("bundle_id", hex), observability::StringField("topic", bundle.topic),
                                        observability::StringField("priority", model::ToString(bundle.priority)),
                                        observability::StringField("audience", model::ToString(bundle.audience))});
  }
  return bundle.id;
}

// ---------------------------------------------------------------------------
// Subscriptions and trust
// ---------------------------------------------------------------------------

void CourierNode::Subscribe(const std::string& topic) {
  std::unique_lock lock(peers_mutex_);
  subscriptions_.insert(topic);
}

void CourierNode::Unsubscribe(const std::string& topic) {
  std::unique_lock lock(peers_mutex_);
  subscriptions_.erase(topic);
}

std::vector<std::string> CourierNode::Subscriptions() const {
  std::shared_lock lock(peers_mutex_);
  return {subscriptions_.begin(), subscriptions_.end()};
}

void CourierNode::TrustPeer(const std::string& node_id) {
  std::unique_lock lock(peers_mutex_);
  trusted_peers_.insert(node_id);
}

bool CourierNode::IsTrusted(const std::string& node_id) const {
  std::shared_lock lock(peers_mutex_);
  return trusted_peers_.contains(node_id);
}

bool CourierNode::IsLocalDestination(const model::Bundle& bundle) const {
  const auto destination = model::Destination::Parse(bundle.destination);
  if (!destination) return false;

  if (destination->scheme == model::Scheme::kNode) {
    return destination->scope == identity_->NodeId();
  }

  std::shared_lock lock(peers_mutex_);
  return subscriptions_.contains(destination->topic);
}

// ---------------------------------------------------------------------------
// Neighbors
// ---------------------------------------------------------------------------

void CourierNode::Connect(std::shared_ptr<propagation::NeighborLink> link) {
  if (!link) {
    throw util::InvalidArgument("null neighbor link");
  }
  if (!identity_->Available()) {
    throw util::InvalidState("node identity has been wiped");
  }
  auto worker = std::make_unique<propagation::PropagationWorker>(*this, std::move(link), options_.session);
  worker->Start();

  std::lock_guard lock(workers_mutex_);
  PruneWorkers();
  workers_.push_back(std::move(worker));
}

void CourierNode::PruneWorkers() {
  std::erase_if(workers_, [this](const std::unique_ptr<propagation::PropagationWorker>& worker) {
    if (worker->Running()) return false;
    worker->Stop(std::chrono::milliseconds(0));
    suspect_signatures_ += worker->Counters().bad_signatures;
    return true;
  });
}

void CourierNode::StopWorkers(std::chrono::milliseconds grace) {
  std::vector<std::unique_ptr<propagation::PropagationWorker>> workers;
  {
    std::lock_guard lock(workers_mutex_);
    workers.swap(workers_);
  }
  for (auto& worker : workers) {
    worker->Stop(grace);
    suspect_signatures_ += worker->Counters().bad_signatures;
  }
}

// ---------------------------------------------------------------------------
// ExchangeHost
// ---------------------------------------------------------------------------

codec::HelloFrame CourierNode::LocalHello() {
  codec::HelloFrame hello;
  hello.signing_key = identity_->SigningKey();
  hello.box_key     = identity_->BoxKey();
  hello.relay_all   = options_.relay_all;

  auto topics = Subscriptions();
  if (topics.size() > codec::kMaxHelloSubscriptions) topics.resize(codec::kMaxHelloSubscriptions);
  hello.subscriptions = std::move(topics);

  hello.signature = identity_->Sign(codec::HelloPreimage(hello));
  return hello;
}

NeighborInfo CourierNode::AcceptHello(const codec::HelloFrame& hello) {
  NeighborInfo info;
  info.node_id       = model::NodeIdOf(hello.signing_key);
  info.signing_key   = hello.signing_key;
  info.box_key       = hello.box_key;
  info.relay_all     = hello.relay_all;
  info.trusted       = IsTrusted(info.node_id);
  info.subscriptions = hello.subscriptions;

  keys_->Learn(info.node_id, info.box_key);
  return info;
}

void CourierNode::BeforeRound(uint64_t now_ms) {
  if (reaper_) reaper_->Sweep(now_ms);
}

bool CourierNode::Relevant(const scheduler::QueueEntry& entry, const NeighborInfo& neighbor) const {
  if (entry.audience == model::Audience::kTrusted && !neighbor.trusted) {
    return false;
  }

  const auto destination = model::Destination::Parse(entry.destination);
  if (!destination) return false;

  if (destination->scheme == model::Scheme::kNode && destination->scope == neighbor.node_id) {
    return true;
  }
  if (neighbor.relay_all) {
    return true;
  }
  return destination->scheme != model::Scheme::kNode &&
         std::find(neighbor.subscriptions.begin(), neighbor.subscriptions.end(), destination->topic) != neighbor.subscriptions.end();
}

std::vector<model::BundleId> CourierNode::Manifest(const NeighborInfo& neighbor, uint64_t now_ms) {
  auto entries = store_->QueueEntries(neighbor.node_id, now_ms);
  std::erase_if(entries, [&](const scheduler::QueueEntry& entry) { return !Relevant(entry, neighbor); });

  std::vector<model::BundleId> ids;
  ids.reserve(entries.size());
  for (const auto& entry : scheduler::PriorityScheduler::Order(std::move(entries))) {
    if (auto id = model::IdFromHex(entry.id)) ids.push_back(*id);
  }
  return ids;
}

std::vector<model::BundleId> CourierNode::Missing(const std::vector<model::BundleId>& offered) {
  std::vector<model::BundleId> missing;
  for (const auto& id : offered) {
    if (!store_->Contains(id)) missing.push_back(id);
  }
  return missing;
}

std::optional<std::vector<uint8_t>> CourierNode::Serve(const model::BundleId& id, const NeighborInfo& neighbor, uint64_t now_ms) {
  const auto record = store_->Describe(id);
  if (!record || record->expires_at_ms < now_ms || record->HopsRemaining() == 0 ||
      record->custody_state == model::CustodyState::kAcknowledged) {
    return std::nullopt;
  }
  if (record->audience == model::Audience::kTrusted && !neighbor.trusted) {
    return std::nullopt;
  }

  auto bundle = store_->Find(id);
  if (!bundle) return std::nullopt;

  store_->RecordOffer(id, neighbor.node_id, now_ms);
  return codec::Encode(*bundle);
}

IngestOutcome CourierNode::Ingest(std::span<const uint8_t> wire, const NeighborInfo& neighbor, uint64_t now_ms) {
  observability::SpanScope span("node.ingest");
  span.SetNeighbor(neighbor.node_id);

  model::Bundle bundle;
  try {
    bundle = codec::Decode(wire);
  } catch (const util::DecodeError& e) {
    COURIER_LOG_WARN("undecodable bundle from neighbor", {observability::IdField("neighbor", neighbor.node_id), observability::StringField("error", e.what())});
    span.Fail(e.what());
    return IngestOutcome{IngestStatus::kUndecodable, std::nullopt, std::nullopt};
  }

  const auto hex = model::IdToHex(bundle.id);
  span.SetBundle(hex);

  // A copy claiming a held id must still carry that id's signature.
  if (!store::BundleValidator::VerifyIntegrity(bundle)) {
    counters_->Record(BundleEvent::kRejected, bundle.priority, bundle.topic);
    COURIER_LOG_WARN("bundle signature invalid", {observability::IdField("bundle_id", hex), observability::IdField("neighbor", neighbor.node_id)});
    span.SetAttribute("courier.rejected", store::ToString(store::RejectReason::kSignatureInvalid));
    return IngestOutcome{IngestStatus::kRejected, bundle.id, store::RejectReason::kSignatureInvalid};
  }
  if (store_->Contains(bundle.id)) {
    return IngestOutcome{IngestStatus::kDuplicate, bundle.id, std::nullopt};
  }

  // one transfer, one hop
  if (bundle.hop_count == std::numeric_limits<uint16_t>::max()) {
    return IngestOutcome{IngestStatus::kRejected, bundle.id, store::RejectReason::kHopLimitExceeded};
  }
  ++bundle.hop_count;

  const bool local   = IsLocalDestination(bundle);
  const auto outcome = store_->Put(bundle, now_ms, store::PutOptions{.local_destination = local, .hold_custody = true});

  if (outcome.IsDuplicate()) {
    return IngestOutcome{IngestStatus::kDuplicate, bundle.id, std::nullopt};
  }

  if (outcome.IsRejected()) {
    if (outcome.reason != store::RejectReason::kStorageFull) {
      counters_->Record(BundleEvent::kRejected, bundle.priority, bundle.topic);
    }
    if (outcome.reason == store::RejectReason::kSignatureInvalid) {
      COURIER_LOG_WARN("bundle signature invalid", {observability::IdField("bundle_id", hex), observability::IdField("neighbor", neighbor.node_id)});
    } else if (outcome.reason != store::RejectReason::kExpired) {
      COURIER_LOG_DEBUG("bundle rejected", {observability::IdField("bundle_id", hex), observability::StringField("reason", store::ToString(outcome.reason)),
                                            observability::IntField("hop_count", bundle.hop_count)});
    }
    span.SetAttribute("courier.rejected", store::ToString(outcome.reason));
    return IngestOutcome{IngestStatus::kRejected, bundle.id, outcome.reason};
  }

  counters_->Record(BundleEvent::kReceived, bundle.priority, bundle.topic);

  if (bundle.custody_ack) {
    ApplyCustodyAck(bundle);
  } else if (local) {
    Deliver(bundle, now_ms);
  }

  return IngestOutcome{bundle.custody_requested ? IngestStatus::kCustodyAccepted : IngestStatus::kStored, bundle.id, std::nullopt};
}

void CourierNode::OnReceipt(const model::BundleId& id, codec::ReceiptStatus status, const NeighborInfo& neighbor, uint64_t now_ms) {
  switch (status) {
    case codec::ReceiptStatus::kStored:
    case codec::ReceiptStatus::kCustodyAccepted: {
      store_->RecordTransfer(id, neighbor.node_id, now_ms, status == codec::ReceiptStatus::kCustodyAccepted);
      if (auto record = store_->Describe(id)) {
        counters_->Record(BundleEvent::kForwarded, record->priority, record->topic);
      }
      break;
    }
    case codec::ReceiptStatus::kDuplicate:
      store_->RecordTransfer(id, neighbor.node_id, now_ms, false);
      break;
    case codec::ReceiptStatus::kRejected:
      store_->RecordFailure(id, neighbor.node_id, now_ms);
      break;
  }
}

void CourierNode::OnUnreceipted(const model::BundleId& id, const NeighborInfo& neighbor, uint64_t now_ms) {
  store_->RecordFailure(id, neighbor.node_id, now_ms);
}

// ---------------------------------------------------------------------------
// Delivery and custody
// ---------------------------------------------------------------------------

void CourierNode::Deliver(const model::Bundle& bundle, uint64_t now_ms) {
  const auto seq = store_->RecordDelivery(bundle.id, bundle.topic, now_ms);
  counters_->Record(BundleEvent::kDelivered, bundle.priority, bundle.topic);
  COURIER_LOG_DEBUG("bundle delivered", {observability::IdField("bundle_id", model::IdToHex(bundle.id)), observability::StringField("topic", bundle.topic),
                                         observability::IntField("seq", static_cast<int64_t>(seq))});

  const auto destination = model::Destination::Parse(bundle.destination);
  if (bundle.custody_requested && destination && destination->scheme == model::Scheme::kNode) {
    EmitCustodyAck(bundle, now_ms);
  }
}

void CourierNode::EmitCustodyAck(const model::Bundle& delivered, uint64_t now_ms) {
  if (!identity_->Available()) return;

  const auto expires_at = delivered.ExpiresAtMs();
  if (expires_at <= now_ms) return;

  model::Bundle ack;
  ack.destination   = "node://" + model::NodeIdOf(delivered.source) + "/" + std::string(model::kCustodyAckTopic);
  ack.topic         = std::string(model::kCustodyAckTopic);
  ack.priority      = model::Priority::kExpedited;
  ack.audience      = model::Audience::kPublic;
  ack.custody_ack   = true;
  ack.created_at_ms = now_ms;
  ack.ttl_ms        = expires_at - now_ms;
  ack.hop_limit     = options_.default_hop_limit;
  ack.payload.assign(delivered.id.begin(), delivered.id.end());
  ack = SignedBundle(std::move(ack));

  const auto outcome = store_->Put(ack, now_ms, store::PutOptions{});
  if (outcome.IsRejected()) {
    COURIER_LOG_WARN("custody ack not stored", {observability::IdField("bundle_id", model::IdToHex(delivered.id)),
                                                observability::StringField("reason", store::ToString(outcome.reason))});
    return;
  }
  counters_->Record(BundleEvent::kCreated, ack.priority, ack.topic);
  ApplyCustodyAck(ack);
}

void CourierNode::ApplyCustodyAck(const model::Bundle& ack) {
  if (ack.payload.size() != model::kBundleIdSize) {
    COURIER_LOG_WARN("malformed custody ack", {observability::IdField("bundle_id", model::IdToHex(ack.id))});
    return;
  }
  model::BundleId acked{};
  std::copy(ack.payload.begin(), ack.payload.end(), acked.begin());

  const auto record = store_->Describe(acked);
  if (!record) return;

  // only the destination itself may acknowledge
  const auto destination = model::Destination::Parse(record->destination);
  if (!destination || destination->scheme != model::Scheme::kNode || destination->scope != model::NodeIdOf(ack.source)) {
    COURIER_LOG_WARN("custody ack from a node that is not the destination", {observability::IdField("bundle_id", record->id)});
    return;
  }

  if (store_->AcknowledgeDelivery(acked)) {
    COURIER_LOG_DEBUG("custody acknowledged", {observability::IdField("bundle_id", record->id)});
  }

  // the origin is where the ack stops
  if (ack.destination == "node://" + identity_->NodeId() + "/" + std::string(model::kCustodyAckTopic)) {
    store_->AcknowledgeDelivery(ack.id);
  }
}

// ---------------------------------------------------------------------------
// Operations
// ---------------------------------------------------------------------------

uint64_t CourierNode::Wipe(bool purge_store) {
  COURIER_LOG_WARN("emergency wipe requested", {observability::BoolField("purge_store", purge_store)});

  StopWorkers(std::chrono::milliseconds(0));

  identity_->Wipe();
  if (group_key_) group_key_->Wipe();
  keys_->Clear();

  uint64_t purged = 0;
  if (purge_store) {
    purged = store_->PurgeAll();
  }
  COURIER_LOG_WARN("emergency wipe complete", {observability::IntField("bundles_purged", static_cast<int64_t>(purged))});
  return purged;
}

NodeHealth CourierNode::Health() {
  NodeHealth health;
  health.identity_available = identity_->Available();
  health.trusted_group_loaded = sealer_->CanReadTrusted();
  health.store_failed       = reaper_ && reaper_->Failed();

  std::lock_guard lock(workers_mutex_);
  for (const auto& worker : workers_) {
    if (worker->Failed()) health.store_failed = true;
    if (worker->Running()) ++health.active_neighbors;
  }
  health.serving = started_.load() && health.identity_available && !health.store_failed;
  return health;
}

NodeStats CourierNode::Stats() {
  NodeStats stats;
  stats.store               = store_->Stats();
  stats.counters            = counters_->Snapshot();
  stats.unreadable_payloads = feed_->Unreadable();

  std::lock_guard lock(workers_mutex_);
  PruneWorkers();
  stats.suspect_signatures = suspect_signatures_.load();
  for (const auto& worker : workers_) {
    ++stats.active_neighbors;
    stats.suspect_signatures += worker->Counters().bad_signatures;
  }
  return stats;
}

} // namespace courier::core
