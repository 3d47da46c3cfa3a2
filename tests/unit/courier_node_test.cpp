#include "internal/core/courier_node.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "internal/codec/bundle_codec.hpp"
#include "internal/codec/frame_codec.hpp"
#include "internal/crypto/signer.hpp"
#include "internal/propagation/loopback_link.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_bundles.hpp"
#include "tests/support/test_nodes.hpp"

namespace {

using courier::core::SubmitRequest;
using courier::model::Audience;
using courier::model::CustodyState;
using courier::model::Priority;
using courier::observability::BundleEvent;
using courier::propagation::IngestStatus;
using courier::testing::Carry;
using courier::testing::MakeNode;

constexpr uint64_t kNow = 5'000'000;

std::vector<uint8_t> Bytes(const std::string& text) {
  return {text.begin(), text.end()};
}

std::string Text(const std::vector<uint8_t>& bytes) {
  return {bytes.begin(), bytes.end()};
}

SubmitRequest Request(std::string destination, std::string plaintext = "hello") {
  SubmitRequest request;
  request.destination = std::move(destination);
  request.plaintext   = Bytes(plaintext);
  return request;
}

template <typename Error>
bool Throws(courier::core::CourierNode& node, const SubmitRequest& request) {
  try {
    node.Submit(request, kNow);
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestSubmitRejectsRequestsThatCanNeverBeSent() {
  auto n = MakeNode();

  assert(Throws<courier::util::InvalidArgument>(*n.node, Request("mesh/alerts")));
  assert(Throws<courier::util::InvalidArgument>(*n.node, Request("topic://mesh/a b")));

  auto mismatch  = Request("topic://mesh/alerts");
  mismatch.topic = "other";
  assert(Throws<courier::util::InvalidArgument>(*n.node, mismatch));

  auto huge      = Request("topic://mesh/alerts");
  huge.plaintext = std::vector<uint8_t>(courier::codec::kMaxPayloadBytes + 1, 0x41);
  assert(Throws<courier::util::InvalidArgument>(*n.node, huge));

  // no group key on this node
  auto trusted     = Request("trusted://mesh/ops");
  trusted.audience = Audience::kTrusted;
  assert(Throws<courier::util::InvalidArgument>(*n.node, trusted));

  // recipient box key never learned
  auto sealed     = Request("node://" + std::string(64, 'a') + "/inbox");
  sealed.audience = Audience::kDestinationOnly;
  assert(Throws<courier::util::InvalidArgument>(*n.node, sealed));

  auto not_node     = Request("topic://mesh/alerts");
  not_node.audience = Audience::kDestinationOnly;
  assert(Throws<courier::util::InvalidArgument>(*n.node, not_node));

  assert(n.store->Stats().bundles == 0);
  assert(n.counters->Count(BundleEvent::kCreated) == 0);
}

void TestSubmitAppliesNodeDefaults() {
  auto options              = courier::core::NodeOptions{};
  options.default_ttl       = std::chrono::minutes(10);
  options.default_hop_limit = 7;
  auto n                    = MakeNode(options);

  const auto id     = n.node->Submit(Request("topic://mesh/alerts"), kNow);
  const auto bundle = n.store->Get(id);
  assert(bundle.topic == "alerts");
  assert(bundle.ttl_ms == 600'000);
  assert(bundle.hop_limit == 7);
  assert(bundle.hop_count == 0);
  assert(bundle.created_at_ms == kNow);
  assert(courier::model::NodeIdOf(bundle.source) == n.Id());
  assert(courier::codec::ComputeId(bundle) == id);

  auto custom      = Request("topic://mesh/alerts", "other");
  custom.ttl       = std::chrono::seconds(5);
  custom.hop_limit = 2;
  custom.priority  = Priority::kEmergency;
  const auto other = n.store->Get(n.node->Submit(custom, kNow));
  assert(other.ttl_ms == 5000);
  assert(other.hop_limit == 2);
  assert(other.priority == Priority::kEmergency);

  assert(n.counters->Count(BundleEvent::kCreated) == 2);
}

void TestOwnSubmissionsAreNotDelivered() {
  auto n = MakeNode(courier::testing::FastSessionOptions({"alerts"}));
  n.node->Submit(Request("topic://mesh/alerts"), kNow);
  assert(n.node->Deliveries().Read("", 0, 10, kNow).empty());
}

void TestIngestDeliversSubscribedTopics() {
  auto sender   = MakeNode();
  auto receiver = MakeNode(courier::testing::FastSessionOptions({"alerts"}));

  const auto id = sender.node->Submit(Request("topic://mesh/alerts", "river rising"), kNow);

  const auto first = Carry(sender, receiver, id, kNow + 10);
  assert(first.status == IngestStatus::kStored);
  assert(receiver.store->Get(id).hop_count == 1);

  assert(Carry(sender, receiver, id, kNow + 20).status == IngestStatus::kDuplicate);

  const auto delivered = receiver.node->Deliveries().Read("alerts", 0, 10, kNow + 30);
  assert(delivered.size() == 1);
  assert(delivered[0].id == id);
  assert(delivered[0].source == sender.Id());
  assert(Text(delivered[0].plaintext) == "river rising");
  assert(delivered[0].delivered_at_ms == kNow + 10);

  assert(receiver.counters->Count(BundleEvent::kReceived) == 1);
  assert(receiver.counters->Count(BundleEvent::kDelivered) == 1);

  // relayed, not delivered, on a node that does not subscribe
  auto relay = MakeNode();
  assert(Carry(sender, relay, id, kNow).status == IngestStatus::kStored);
  assert(relay.node->Deliveries().Read("", 0, 10, kNow).empty());
}

void TestIngestRejectsGarbageAndSpentBundles() {
  auto sender   = MakeNode();
  auto receiver = MakeNode(courier::testing::FastSessionOptions({"local"}));

  const std::vector<uint8_t> garbage{0x01, 0x02, 0x03};
  const auto                 undecodable = receiver.node->Ingest(garbage, sender.AsNeighbor(), kNow);
  assert(undecodable.status == IngestStatus::kUndecodable);
  assert(!undecodable.id.has_value());

  auto one_hop      = Request("topic://mesh/relay", "x");
  one_hop.hop_limit = 1;
  const auto spent  = sender.node->Submit(one_hop, kNow);
  const auto outcome = Carry(sender, receiver, spent, kNow);
  assert(outcome.status == IngestStatus::kRejected);
  assert(outcome.reason == courier::store::RejectReason::kHopLimitExceeded);

  // the last hop may still land where it is addressed
  auto last_hop      = Request("topic://mesh/local", "y");
  last_hop.hop_limit = 1;
  const auto local   = sender.node->Submit(last_hop, kNow);
  assert(Carry(sender, receiver, local, kNow).status == IngestStatus::kStored);
  assert(receiver.node->Deliveries().Read("local", 0, 10, kNow).size() == 1);

  // a copy altered in transit is refused even though its id is held
  const auto rejected_before = receiver.counters->Count(BundleEvent::kRejected);
  auto       tampered        = sender.store->Get(local);
  tampered.payload[0] ^= 0xFF;
  const auto forged = receiver.node->Ingest(courier::codec::Encode(tampered), sender.AsNeighbor(), kNow);
  assert(forged.status == IngestStatus::kRejected);
  assert(forged.reason == courier::store::RejectReason::kSignatureInvalid);
  assert(receiver.counters->Count(BundleEvent::kRejected) == rejected_before + 1);
  assert(receiver.store->Get(local).payload == sender.store->Get(local).payload);

  // the untouched copy is still just a duplicate
  const auto again = receiver.node->Ingest(courier::codec::Encode(sender.store->Get(local)), sender.AsNeighbor(), kNow);
  assert(again.status == IngestStatus::kDuplicate);

  auto fresh     = MakeNode();
  const auto bad = fresh.node->Ingest(courier::codec::Encode(tampered), sender.AsNeighbor(), kNow);
  assert(bad.status == IngestStatus::kRejected);
  assert(bad.reason == courier::store::RejectReason::kSignatureInvalid);
  assert(fresh.store->Stats().bundles == 0);
}

void TestDestinationOnlyPayloadReachesOnlyTheRecipient() {
  auto sender    = MakeNode();
  auto recipient = MakeNode();
  auto relay     = MakeNode();
  sender.keys->Learn(recipient.Id(), recipient.identity->BoxKey());

  auto request     = Request("node://" + recipient.Id() + "/inbox", "for your eyes");
  request.audience = Audience::kDestinationOnly;
  const auto id    = sender.node->Submit(request, kNow);

  assert(Text(sender.store->Get(id).payload) != "for your eyes");

  assert(Carry(sender, relay, id, kNow).status == IngestStatus::kStored);
  assert(relay.node->Deliveries().Read("", 0, 10, kNow).empty());

  assert(Carry(relay, recipient, id, kNow).status == IngestStatus::kStored);
  const auto delivered = recipient.node->Deliveries().Read("inbox", 0, 10, kNow);
  assert(delivered.size() == 1);
  assert(Text(delivered[0].plaintext) == "for your eyes");
  assert(recipient.store->Get(id).hop_count == 2);
}

void TestTrustedPayloadNeedsTheGroupKey() {
  auto group    = courier::crypto::GroupKey::Generate();
  auto sender   = MakeNode({}, group);
  auto member   = MakeNode(courier::testing::FastSessionOptions({"ops"}), group);
  auto outsider = MakeNode(courier::testing::FastSessionOptions({"ops"}));

  auto request     = Request("trusted://mesh/ops", "rally at dawn");
  request.audience = Audience::kTrusted;
  const auto id    = sender.node->Submit(request, kNow);

  assert(Carry(sender, member, id, kNow).status == IngestStatus::kStored);
  const auto delivered = member.node->Deliveries().Read("ops", 0, 10, kNow);
  assert(delivered.size() == 1);
  assert(Text(delivered[0].plaintext) == "rally at dawn");

  // stored and counted, but never surfaced without the key
  assert(Carry(sender, outsider, id, kNow).status == IngestStatus::kStored);
  assert(outsider.node->Deliveries().Read("ops", 0, 10, kNow).empty());
  assert(outsider.node->Stats().unreadable_payloads == 1);
}

void TestManifestFollowsNeighborInterest() {
  auto group  = courier::crypto::GroupKey::Generate();
  auto origin = MakeNode({}, group);
  auto peer   = MakeNode();

  const auto weather = origin.node->Submit(Request("topic://mesh/weather"), kNow);
  const auto traffic = origin.node->Submit(Request("topic://mesh/traffic"), kNow);
  const auto direct  = origin.node->Submit(Request("node://" + peer.Id() + "/inbox"), kNow);

  auto ops_request     = Request("trusted://mesh/ops");
  ops_request.audience = Audience::kTrusted;
  const auto ops       = origin.node->Submit(ops_request, kNow);

  auto selective          = peer.AsNeighbor();
  selective.relay_all     = false;
  selective.subscriptions = {"weather"};
  auto manifest           = origin.node->Manifest(selective, kNow);
  std::sort(manifest.begin(), manifest.end());
  std::vector<courier::model::BundleId> expected{weather, direct};
  std::sort(expected.begin(), expected.end());
  assert(manifest == expected);

  assert(origin.node->Manifest(peer.AsNeighbor(false), kNow).size() == 3);
  assert(origin.node->Manifest(peer.AsNeighbor(true), kNow).size() == 4);

  assert(!origin.node->Serve(ops, peer.AsNeighbor(false), kNow).has_value());
  assert(origin.node->Serve(ops, peer.AsNeighbor(true), kNow).has_value());
  assert(origin.node->Serve(traffic, peer.AsNeighbor(false), kNow).has_value());

  assert((origin.node->Missing({weather, traffic}) == std::vector<courier::model::BundleId>{}));
  assert(peer.node->Missing({weather, traffic}).size() == 2);
}

void TestCustodyAckReleasesTheOrigin() {
  auto origin      = MakeNode();
  auto destination = MakeNode();

  auto request              = Request("node://" + destination.Id() + "/orders", "hold the bridge");
  request.custody_requested = true;
  request.priority          = Priority::kEmergency;
  const auto id             = origin.node->Submit(request, kNow);
  assert(origin.store->Describe(id)->custody_state == CustodyState::kHeld);

  assert(Carry(origin, destination, id, kNow + 100).status == IngestStatus::kCustodyAccepted);
  assert(destination.node->Deliveries().Read("orders", 0, 10, kNow + 100).size() == 1);
  assert(destination.store->Describe(id)->custody_state == CustodyState::kAcknowledged);

  auto acks = destination.store->ListPending(courier::store::PendingFilter{.topic = std::string(courier::model::kCustodyAckTopic)}, kNow + 100);
  const auto ack = acks.Next();
  assert(ack.has_value());
  assert(ack->custody_ack);
  assert(ack->priority == Priority::kExpedited);
  assert(ack->destination == "node://" + origin.Id() + "/custody-acks");
  assert(ack->ExpiresAtMs() == origin.store->Get(id).ExpiresAtMs());
  assert((std::vector<uint8_t>(id.begin(), id.end()) == ack->payload));

  assert(Carry(destination, origin, ack->id, kNow + 200).status == IngestStatus::kStored);
  assert(origin.store->Describe(id)->custody_state == CustodyState::kAcknowledged);
  assert(origin.store->Describe(ack->id)->custody_state == CustodyState::kAcknowledged);
  assert(origin.store->Stats().custody_held == 0);

  // acks are not consumer deliveries
  assert(origin.node->Deliveries().Read("", 0, 10, kNow + 200).empty());
}

void TestCustodyAckFromAnotherNodeIsIgnored() {
  auto origin      = MakeNode();
  auto destination = MakeNode();

  auto request              = Request("node://" + destination.Id() + "/orders");
  request.custody_requested = true;
  const auto id             = origin.node->Submit(request, kNow);

  const auto forger = courier::crypto::GenerateSigningKeyPair();
  auto       ack    = courier::testing::MakeBundle(forger, courier::testing::BundleSpec{
                                                      .destination   = "node://" + origin.Id() + "/custody-acks",
                                                      .priority      = Priority::kExpedited,
                                                      .created_at_ms = kNow,
                                                  });
  ack.custody_ack = true;
  ack.payload.assign(id.begin(), id.end());
  ack.id        = courier::codec::ComputeId(ack);
  ack.signature = courier::crypto::Sign(courier::codec::IdPreimage(ack), forger.secret);

  const auto outcome = origin.node->Ingest(courier::codec::Encode(ack), destination.AsNeighbor(), kNow);
  assert(outcome.status == IngestStatus::kStored);
  assert(origin.store->Describe(id)->custody_state == CustodyState::kHeld);
}

void TestWipeDisablesTheNode() {
  auto n = MakeNode();
  n.node->Start();
  n.node->Submit(Request("topic://mesh/a", "1"), kNow);
  n.node->Submit(Request("topic://mesh/b", "2"), kNow);

  auto health = n.node->Health();
  assert(health.serving);
  assert(health.identity_available);
  assert(!health.trusted_group_loaded);

  assert(n.node->Wipe(true) == 2);
  assert(n.store->Stats().bundles == 0);
  assert(!n.identity->Available());
  assert(n.keys->Size() == 0);

  health = n.node->Health();
  assert(!health.serving);
  assert(!health.identity_available);

  assert(Throws<courier::util::InvalidState>(*n.node, Request("topic://mesh/a", "3")));
  n.node->Stop();
}

void TestConnectAfterWipeIsRefused() {
  auto n = MakeNode();
  n.node->Start();
  n.node->Wipe(false);

  auto links = courier::propagation::LoopbackLink::CreatePair("wiped", "peer");
  bool threw = false;
  try {
    n.node->Connect(links.first);
  } catch (const courier::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(n.node->Health().active_neighbors == 0);
  n.node->Stop();
}

void TestWipeCanKeepTheStore() {
  auto n = MakeNode();
  n.node->Submit(Request("topic://mesh/a"), kNow);
  assert(n.node->Wipe(false) == 0);
  assert(n.store->Stats().bundles == 1);
}

void TestStatsReportCountersAndStore() {
  auto sender   = MakeNode();
  auto receiver = MakeNode(courier::testing::FastSessionOptions({"alerts"}));

  auto request     = Request("topic://mesh/alerts");
  request.priority = Priority::kExpedited;
  const auto id    = sender.node->Submit(request, kNow);
  Carry(sender, receiver, id, kNow);

  const auto stats = receiver.node->Stats();
  assert(stats.store.bundles == 1);
  assert(stats.active_neighbors == 0);
  assert(stats.suspect_signatures == 0);

  const auto delivered = std::find_if(stats.counters.begin(), stats.counters.end(), [](const auto& entry) {
    return entry.event == BundleEvent::kDelivered;
  });
  assert(delivered != stats.counters.end());
  assert(delivered->priority == Priority::kExpedited);
  assert(delivered->topic == "alerts");
  assert(delivered->count == 1);
}

void TestSubscriptionsAndTrust() {
  auto n = MakeNode();
  n.node->Subscribe("b");
  n.node->Subscribe("a");
  assert((n.node->Subscriptions() == std::vector<std::string>{"a", "b"}));
  n.node->Unsubscribe("b");
  assert((n.node->Subscriptions() == std::vector<std::string>{"a"}));

  const auto hello = n.node->LocalHello();
  assert(courier::crypto::Verify(courier::codec::HelloPreimage(hello), hello.signature, hello.signing_key));
  assert((hello.subscriptions == std::vector<std::string>{"a"}));

  auto peer = MakeNode();
  assert(!n.node->AcceptHello(peer.node->LocalHello()).trusted);
  n.node->TrustPeer(peer.Id());
  const auto info = n.node->AcceptHello(peer.node->LocalHello());
  assert(info.trusted);
  assert(info.node_id == peer.Id());
  assert(n.keys->Lookup(peer.Id()).has_value());
}

} // namespace

int main() {
  TestSubmitRejectsRequestsThatCanNeverBeSent();
  TestSubmitAppliesNodeDefaults();
  TestOwnSubmissionsAreNotDelivered();
  TestIngestDeliversSubscribedTopics();
  TestIngestRejectsGarbageAndSpentBundles();
  TestDestinationOnlyPayloadReachesOnlyTheRecipient();
  TestTrustedPayloadNeedsTheGroupKey();
  TestManifestFollowsNeighborInterest();
  TestCustodyAckReleasesTheOrigin();
  TestCustodyAckFromAnotherNodeIsIgnored();
  TestWipeDisablesTheNode();
  TestConnectAfterWipeIsRefused();
  TestWipeCanKeepTheStore();
  TestStatsReportCountersAndStore();
  TestSubscriptionsAndTrust();

  std::cout << "courier_unit_courier_node: pass\n";
  return 0;
}
