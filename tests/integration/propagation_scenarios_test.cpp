#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/propagation/loopback_link.hpp"
#include "internal/propagation/neighbor_session.hpp"
#include "tests/support/test_nodes.hpp"

namespace {

using courier::core::SubmitRequest;
using courier::model::Audience;
using courier::model::CustodyState;
using courier::propagation::LoopbackLink;
using courier::propagation::NeighborSession;
using courier::propagation::SessionCounters;
using courier::propagation::SessionState;
using courier::testing::MakeNode;
using courier::testing::TestNode;

constexpr uint64_t kNow = 10'000'000;

struct ContactResult {
  SessionCounters a;
  SessionCounters b;
};

// One complete contact between two nodes: handshake, both rounds, and the
// link dropping once both sides are idle.
ContactResult Contact(TestNode& a, TestNode& b, uint64_t now_ms) {
  auto links = LoopbackLink::CreatePair("a", "b");

  NeighborSession a_session(*a.node, *links.first, {});
  NeighborSession b_session(*b.node, *links.second, {});
  a_session.Start(now_ms);
  b_session.Start(now_ms);

  int steps = 0;
  for (bool moved = true; moved; ++steps) {
    assert(steps < 100'000);
    moved = false;
    if (auto frame = links.first->Receive(std::chrono::milliseconds(0))) {
      a_session.OnFrame(*frame, now_ms);
      moved = true;
    }
    if (auto frame = links.second->Receive(std::chrono::milliseconds(0))) {
      b_session.OnFrame(*frame, now_ms);
      moved = true;
    }
  }
  assert(a_session.State() == SessionState::kIdle);
  assert(b_session.State() == SessionState::kIdle);

  a_session.OnDisconnected(now_ms);
  b_session.OnDisconnected(now_ms);
  links.first->Close();
  return {a_session.Counters(), b_session.Counters()};
}

courier::model::BundleId Submit(TestNode& node, const std::string& destination, const std::string& text, SubmitRequest request = {}) {
  request.destination = destination;
  request.plaintext.assign(text.begin(), text.end());
  return node.node->Submit(request, kNow);
}

void TestRelayThroughAnIntermediateNode() {
  auto origin = MakeNode();
  auto relay  = MakeNode();
  auto sink   = MakeNode(courier::testing::FastSessionOptions({"news"}));

  const auto id = Submit(origin, "topic://mesh/news", "bridge open");

  const auto first = Contact(origin, relay, kNow);
  assert(first.a.bundles_sent == 1);
  assert(first.b.bundles_received == 1);
  assert(relay.store->Get(id).hop_count == 1);
  assert(relay.node->Deliveries().Read("", 0, 10, kNow).empty());

  Contact(relay, sink, kNow + 1000);
  assert(sink.store->Get(id).hop_count == 2);

  const auto delivered = sink.node->Deliveries().Read("news", 0, 10, kNow + 1000);
  assert(delivered.size() == 1);
  assert(delivered[0].source == origin.Id());
  assert(std::string(delivered[0].plaintext.begin(), delivered[0].plaintext.end()) == "bridge open");

  // nothing new to move on a later contact
  const auto again = Contact(origin, relay, kNow + 2000);
  assert(again.a.bundles_sent == 0);
  assert(again.b.bundles_sent == 0);
}

void TestHopLimitStopsALongChain() {
  constexpr std::size_t kChain = courier::core::kDefaultHopLimit + 2;

  std::vector<TestNode> chain;
  for (std::size_t i = 0; i < kChain; ++i) {
    chain.push_back(MakeNode());
  }
  const auto id = Submit(chain[0], "topic://mesh/flood", "far");

  for (std::size_t i = 0; i + 1 < kChain; ++i) {
    Contact(chain[i], chain[i + 1], kNow + i);
  }

  // the copy at the hop limit is refused by a node that only relays
  const std::size_t last_holder = courier::core::kDefaultHopLimit - 1;
  assert(chain[last_holder].store->Get(id).hop_count == last_holder);
  assert(!chain[last_holder + 1].store->Contains(id));
  assert(!chain[last_holder + 2].store->Contains(id));
  assert(chain[last_holder + 1].counters->Count(courier::observability::BundleEvent::kRejected) == 1);
}

void TestLastHopStillReachesASubscriber() {
  auto origin = MakeNode();
  auto relay  = MakeNode();
  auto sink   = MakeNode(courier::testing::FastSessionOptions({"near"}));

  SubmitRequest request;
  request.hop_limit = 2;
  const auto id     = Submit(origin, "topic://mesh/near", "two hops", request);

  Contact(origin, relay, kNow);
  Contact(relay, sink, kNow);
  assert(sink.store->Get(id).hop_count == 2);
  assert(sink.node->Deliveries().Read("near", 0, 10, kNow).size() == 1);

  // spent: held for delivery, offered to nobody
  auto bystander = MakeNode();
  Contact(sink, bystander, kNow);
  assert(!bystander.store->Contains(id));
}

void TestExpiredBundlesAreNotCarried() {
  auto origin = MakeNode();
  auto peer   = MakeNode();

  SubmitRequest request;
  request.ttl   = std::chrono::seconds(30);
  const auto id = Submit(origin, "topic://mesh/brief", "soon stale", request);

  const auto contact = Contact(origin, peer, kNow + 31'000);
  assert(contact.a.bundles_sent == 0);
  assert(!peer.store->Contains(id));
  assert(!origin.store->Contains(id));
  assert(origin.counters->Count(courier::observability::BundleEvent::kExpired) == 1);
}

void TestTrustedBundlesStayInsideTheGroup() {
  auto group    = courier::crypto::GroupKey::Generate();
  auto origin   = MakeNode({}, group);
  auto member   = MakeNode(courier::testing::FastSessionOptions({"ops"}), group);
  auto outsider = MakeNode(courier::testing::FastSessionOptions({"ops"}));
  origin.node->TrustPeer(member.Id());

  SubmitRequest request;
  request.audience = Audience::kTrusted;
  const auto id    = Submit(origin, "trusted://mesh/ops", "rendezvous", request);

  Contact(origin, outsider, kNow);
  assert(!outsider.store->Contains(id));

  Contact(origin, member, kNow);
  const auto delivered = member.node->Deliveries().Read("ops", 0, 10, kNow);
  assert(delivered.size() == 1);
  assert(std::string(delivered[0].plaintext.begin(), delivered[0].plaintext.end()) == "rendezvous");
}

void TestDestinationOnlyTravelsSealedThroughRelays() {
  auto origin    = MakeNode();
  auto relay     = MakeNode();
  auto recipient = MakeNode();

  // box keys are learned from HELLO frames
  Contact(origin, recipient, kNow);

  SubmitRequest request;
  request.audience = Audience::kDestinationOnly;
  const auto id    = Submit(origin, "node://" + recipient.Id() + "/inbox", "coordinates", request);

  Contact(origin, relay, kNow + 10);
  assert(relay.store->Contains(id));
  assert(relay.node->Deliveries().Read("", 0, 10, kNow + 10).empty());

  Contact(relay, recipient, kNow + 20);
  const auto delivered = recipient.node->Deliveries().Read("inbox", 0, 10, kNow + 20);
  assert(delivered.size() == 1);
  assert(std::string(delivered[0].plaintext.begin(), delivered[0].plaintext.end()) == "coordinates");
}

void TestCustodyAckTravelsBackToTheOrigin() {
  auto origin      = MakeNode();
  auto relay       = MakeNode();
  auto destination = MakeNode();

  SubmitRequest request;
  request.custody_requested = true;
  const auto id             = Submit(origin, "node://" + destination.Id() + "/orders", "advance", request);
  assert(origin.store->Stats().custody_held == 1);

  Contact(origin, relay, kNow + 10);
  assert(relay.store->Describe(id)->custody_state == CustodyState::kHeld);

  Contact(relay, destination, kNow + 20);
  assert(destination.node->Deliveries().Read("orders", 0, 10, kNow + 20).size() == 1);
  assert(destination.store->Describe(id)->custody_state == CustodyState::kAcknowledged);

  // the ack rides back along the same path
  Contact(relay, destination, kNow + 30);
  assert(relay.store->Describe(id)->custody_state == CustodyState::kAcknowledged);

  Contact(origin, relay, kNow + 40);
  assert(origin.store->Describe(id)->custody_state == CustodyState::kAcknowledged);
  assert(origin.store->Stats().custody_held == 0);
  assert(origin.node->Deliveries().Read("", 0, 10, kNow + 40).empty());

  // acknowledged copies are no longer offered
  auto late = MakeNode();
  Contact(origin, late, kNow + 50);
  assert(!late.store->Contains(id));
}

void TestOutOfOrderContactsConverge() {
  auto a = MakeNode(courier::testing::FastSessionOptions({"mesh-chat"}));
  auto b = MakeNode(courier::testing::FastSessionOptions({"mesh-chat"}));
  auto c = MakeNode(courier::testing::FastSessionOptions({"mesh-chat"}));

  const auto from_a = Submit(a, "topic://mesh/mesh-chat", "a says hi");
  const auto from_c = Submit(c, "topic://mesh/mesh-chat", "c says hi");

  Contact(b, c, kNow);
  Contact(a, b, kNow + 10);
  Contact(b, c, kNow + 20);

  for (auto* node : {&a, &b, &c}) {
    assert(node->store->Contains(from_a));
    assert(node->store->Contains(from_c));
  }
  assert(b.node->Deliveries().Read("mesh-chat", 0, 10, kNow + 20).size() == 2);
  assert(a.node->Deliveries().Read("mesh-chat", 0, 10, kNow + 20).size() == 1);
  assert(c.node->Deliveries().Read("mesh-chat", 0, 10, kNow + 20).size() == 1);
}

} // namespace

int main() {
  TestRelayThroughAnIntermediateNode();
  TestHopLimitStopsALongChain();
  TestLastHopStillReachesASubscriber();
  TestExpiredBundlesAreNotCarried();
  TestTrustedBundlesStayInsideTheGroup();
  TestDestinationOnlyTravelsSealedThroughRelays();
  TestCustodyAckTravelsBackToTheOrigin();
  TestOutOfOrderContactsConverge();

  std::cout << "courier_integration_propagation_scenarios: pass\n";
  return 0;
}
