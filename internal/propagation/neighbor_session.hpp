#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "internal/codec/frame_codec.hpp"
#include "internal/propagation/exchange_host.hpp"
#include "internal/propagation/neighbor_link.hpp"

namespace courier::propagation {

enum class SessionState : uint8_t {
  kDiscovered,
  kHandshaking,
  kExchanging,
  kIdle,
  kDisconnected,
};

std::string_view ToString(SessionState state);

struct SessionOptions {
  std::chrono::milliseconds exchange_timeout{std::chrono::seconds(10)};
  std::chrono::milliseconds exchange_interval{std::chrono::seconds(30)};
  std::size_t               max_frame_bytes = codec::kDefaultMaxFrameBytes;
};

struct SessionCounters {
  uint64_t bundles_sent       = 0;
  uint64_t bundles_received   = 0;
  uint64_t bundles_rejected   = 0;
  uint64_t bad_signatures     = 0; // neighbor is suspect when non-zero
  uint64_t undecodable_frames = 0;
};

/*
  NeighborSession

  Per-connection protocol state machine:

    Discovered -> Handshaking -> Exchanging <-> Idle
                       |             |
                       +-------------+--> Disconnected

  A round is one side advertising a MANIFEST; the other answers with a
  REQUEST for the ids it lacks (possibly none), the advertiser sends those
  bundles in manifest order followed by END, and the receiver answers each
  bundle with a RECEIPT. Both sides run their own round after the
  handshake. The session is Idle once its own round has been served, the
  peer's round has ended, and every sent bundle has a receipt. Idle
  sessions re-advertise every exchange_interval.

  A HELLO with another protocol version degrades the session to a no-op
  Idle; a HELLO with a bad signature disconnects.

  Not thread-safe: one PropagationWorker (or a test pump) drives it.
*/
class NeighborSession {
 public:
  NeighborSession(ExchangeHost& host, NeighborLink& link, SessionOptions options);

  void Start(uint64_t now_ms);
  void OnFrame(std::span<const uint8_t> bytes, uint64_t now_ms);
  void Tick(uint64_t now_ms);

  // Link dropped or the worker is shutting down. Unreceipted bundles are
  // reported to the host so they are retried on a later contact.
  void OnDisconnected(uint64_t now_ms);

  SessionState State() const {
    return state_;
  }
  bool Degraded() const {
    return degraded_;
  }
  const std::optional<NeighborInfo>& Neighbor() const {
    return neighbor_;
  }
  const SessionCounters& Counters() const {
    return counters_;
  }
  std::size_t OutstandingReceipts() const {
    return outstanding_.size();
  }

 private:
  void HandleHello(std::span<const uint8_t> bytes, uint64_t now_ms);
  void HandleManifest(const codec::ManifestFrame& frame, uint64_t now_ms);
  void HandleRequest(const codec::RequestFrame& frame, uint64_t now_ms);
  void HandleBundle(const codec::BundleFrame& frame, uint64_t now_ms);
  void HandleReceipt(const codec::ReceiptFrame& frame, uint64_t now_ms);
  void HandleEnd(uint64_t now_ms);

  void BeginRound(uint64_t now_ms);
  void MaybeIdle(uint64_t now_ms);
  bool Send(const codec::Frame& frame, uint64_t now_ms);
  void Disconnect(uint64_t now_ms, std::string_view why);

  ExchangeHost&  host_;
  NeighborLink&  link_;
  SessionOptions options_;

  SessionState                state_    = SessionState::kDiscovered;
  bool                        degraded_ = false;
  std::optional<NeighborInfo> neighbor_;
  SessionCounters             counters_;

  // own round
  std::vector<model::BundleId> manifest_;
  bool                         own_round_open_ = false;
  uint64_t                     round_started_ms_ = 0;

  // peer's round
  std::set<model::BundleId> requested_;
  bool                      peer_round_open_ = false;

  std::set<model::BundleId> outstanding_;
  uint64_t                  last_activity_ms_ = 0;
};

} // namespace courier::propagation
