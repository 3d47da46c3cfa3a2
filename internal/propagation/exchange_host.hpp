#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "internal/codec/frame_codec.hpp"
#include "internal/model/bundle.hpp"
#include "internal/store/put_outcome.hpp"

namespace courier::propagation {

/*
  What the local node learned about a neighbor from its verified HELLO.
*/
struct NeighborInfo {
  std::string              node_id; // hex signing key
  model::SigningPublicKey  signing_key{};
  model::BoxPublicKey      box_key{};
  bool                     relay_all = true;
  bool                     trusted   = false;
  std::vector<std::string> subscriptions;
};

enum class IngestStatus : uint8_t {
  kStored,
  kCustodyAccepted,
  kDuplicate,
  kRejected,
  kUndecodable,
};

struct IngestOutcome {
  IngestStatus                       status = IngestStatus::kRejected;
  std::optional<model::BundleId>     id;     // absent when undecodable
  std::optional<store::RejectReason> reason; // set when rejected
};

/*
  Node-side operations a NeighborSession drives. Implemented by
  core::CourierNode; tests may provide their own.

  Every method may be called from a propagation worker thread and must be
  thread-safe.
*/
class ExchangeHost {
 public:
  virtual ~ExchangeHost() = default;

  virtual codec::HelloFrame LocalHello() = 0;

  // Called with a HELLO whose signature already verified.
  virtual NeighborInfo AcceptHello(const codec::HelloFrame& hello) = 0;

  // Opportunistic maintenance before a manifest is built.
  virtual void BeforeRound(uint64_t now_ms) = 0;

  // Ids relevant to the neighbor, in scheduler order.
  virtual std::vector<model::BundleId> Manifest(const NeighborInfo& neighbor, uint64_t now_ms) = 0;

  // Subset of offered ids not held locally.
  virtual std::vector<model::BundleId> Missing(const std::vector<model::BundleId>& offered) = 0;

  // Wire bytes to send, or nullopt if the bundle is no longer eligible.
  virtual std::optional<std::vector<uint8_t>> Serve(const model::BundleId& id, const NeighborInfo& neighbor, uint64_t now_ms) = 0;

  virtual IngestOutcome Ingest(std::span<const uint8_t> wire, const NeighborInfo& neighbor, uint64_t now_ms) = 0;

  virtual void OnReceipt(const model::BundleId& id, codec::ReceiptStatus status, const NeighborInfo& neighbor, uint64_t now_ms) = 0;

  // A served bundle got no receipt before the session ended.
  virtual void OnUnreceipted(const model::BundleId& id, const NeighborInfo& neighbor, uint64_t now_ms) = 0;
};

} // namespace courier::propagation
