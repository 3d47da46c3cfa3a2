#include "internal/propagation/neighbor_session.hpp"

#include <algorithm>

#include "internal/crypto/signer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace courier::propagation {

std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kDiscovered:
      return "discovered";
    case SessionState::kHandshaking:
      return "handshaking";
    case SessionState::kExchanging:
      return "exchanging";
    case SessionState::kIdle:
      return "idle";
    case SessionState::kDisconnected:
      return "disconnected";
  }
  return "unknown";
}

NeighborSession::NeighborSession(ExchangeHost& host, NeighborLink& link, SessionOptions options)
    : host_(host), link_(link), options_(options) {
}

bool NeighborSession::Send(const codec::Frame& frame, uint64_t now_ms) {
  if (!link_.Send(codec::EncodeFrame(frame))) {
    Disconnect(now_ms, "link closed");
    return false;
  }
  last_activity_ms_ = now_ms;
  return true;
}

void NeighborSession::Start(uint64_t now_ms) {
  if (state_ != SessionState::kDiscovered) return;

  state_            = SessionState::kHandshaking;
  last_activity_ms_ = now_ms;
  Send(host_.LocalHello(), now_ms);
}

void NeighborSession::OnFrame(std::span<const uint8_t> bytes, uint64_t now_ms) {
  if (state_ == SessionState::kDisconnected || degraded_) return;
  last_activity_ms_ = now_ms;

  if (state_ == SessionState::kDiscovered || state_ == SessionState::kHandshaking) {
    HandleHello(bytes, now_ms);
    return;
  }

  codec::Frame frame;
  try {
    frame = codec::DecodeFrame(bytes, options_.max_frame_bytes);
  } catch (const util::DecodeError& e) {
    ++counters_.undecodable_frames;
    COURIER_LOG_WARN("dropping undecodable frame", {observability::StringField("link", link_.Describe()), observability::StringField("error", e.what())});
    return;
  }

  if (const auto* f = std::get_if<codec::ManifestFrame>(&frame)) {
    HandleManifest(*f, now_ms);
  } else if (const auto* f = std::get_if<codec::RequestFrame>(&frame)) {
    HandleRequest(*f, now_ms);
  } else if (const auto* f = std::get_if<codec::BundleFrame>(&frame)) {
    HandleBundle(*f, now_ms);
  } else if (const auto* f = std::get_if<codec::ReceiptFrame>(&frame)) {
    HandleReceipt(*f, now_ms);
  } else if (std::holds_alternative<codec::EndFrame>(frame)) {
    HandleEnd(now_ms);
  } else {
    ++counters_.undecodable_frames;
    COURIER_LOG_WARN("unexpected HELLO after handshake", {observability::StringField("link", link_.Describe())});
    return;
  }

  MaybeIdle(now_ms);
}

void NeighborSession::HandleHello(std::span<const uint8_t> bytes, uint64_t now_ms) {
  const auto version = codec::PeekHelloVersion(bytes);
  if (!version) {
    Disconnect(now_ms, "expected HELLO");
    return;
  }
  if (*version != codec::kProtocolVersion) {
    degraded_ = true;
    state_    = SessionState::kIdle;
    COURIER_LOG_WARN("protocol version mismatch, session idle",
                     {observability::StringField("link", link_.Describe()), observability::IntField("peer_version", *version),
                      observability::IntField("local_version", codec::kProtocolVersion)});
    return;
  }

  codec::HelloFrame hello;
  try {
    hello = std::get<codec::HelloFrame>(codec::DecodeFrame(bytes, options_.max_frame_bytes));
  } catch (const util::DecodeError&) {
    ++counters_.undecodable_frames;
    Disconnect(now_ms, "malformed HELLO");
    return;
  }

  if (!crypto::Verify(codec::HelloPreimage(hello), hello.signature, hello.signing_key)) {
    ++counters_.bad_signatures;
    Disconnect(now_ms, "HELLO signature invalid");
    return;
  }

  neighbor_ = host_.AcceptHello(hello);
  state_    = SessionState::kExchanging;
  // the peer advertises right after its handshake too
  peer_round_open_ = true;

  COURIER_LOG_INFO("neighbor connected", {observability::IdField("neighbor", neighbor_->node_id), observability::BoolField("trusted", neighbor_->trusted),
                                          observability::StringField("link", link_.Describe())});
  BeginRound(now_ms);
}

void NeighborSession::BeginRound(uint64_t now_ms) {
  host_.BeforeRound(now_ms);

  manifest_ = host_.Manifest(*neighbor_, now_ms);

  // keep the MANIFEST frame under the frame limit
  const std::size_t max_ids = options_.max_frame_bytes > 16 ? (options_.max_frame_bytes - 16) / model::kBundleIdSize : 0;
  if (manifest_.size() > max_ids) manifest_.resize(max_ids);

  own_round_open_   = true;
  round_started_ms_ = now_ms;
  state_            = SessionState::kExchanging;
  Send(codec::ManifestFrame{manifest_}, now_ms);
}

void NeighborSession::HandleManifest(const codec::ManifestFrame& frame, uint64_t now_ms) {
  auto missing = host_.Missing(frame.ids);

  requested_.clear();
  requested_.insert(missing.begin(), missing.end());
  peer_round_open_ = true;
  state_           = SessionState::kExchanging;
  Send(codec::RequestFrame{std::move(missing)}, now_ms);
}

void NeighborSession::HandleRequest(const codec::RequestFrame& frame, uint64_t now_ms) {
  const std::set<model::BundleId> wanted(frame.ids.begin(), frame.ids.end());

  // serve in manifest (scheduler) order; ids we never offered are ignored
  for (const auto& id : manifest_) {
    if (!wanted.contains(id) || state_ == SessionState::kDisconnected) continue;

    auto wire = host_.Serve(id, *neighbor_, now_ms);
    if (!wire) continue;
    if (wire->size() + 8 > options_.max_frame_bytes) {
      COURIER_LOG_WARN("bundle exceeds frame limit, not sent", {observability::IdField("bundle_id", model::IdToHex(id))});
      continue;
    }

    if (!Send(codec::BundleFrame{std::move(*wire)}, now_ms)) return;
    outstanding_.insert(id);
    ++counters_.bundles_sent;
  }

  if (Send(codec::EndFrame{}, now_ms)) {
    own_round_open_ = false;
  }
}

void NeighborSession::HandleBundle(const codec::BundleFrame& frame, uint64_t now_ms) {
  auto outcome = host_.Ingest(frame.wire, *neighbor_, now_ms);

  if (outcome.status == IngestStatus::kUndecodable || !outcome.id) {
    ++counters_.bundles_rejected;
    return;
  }

  if (!requested_.contains(*outcome.id) && outcome.status != IngestStatus::kDuplicate) {
    COURIER_LOG_DEBUG("unsolicited bundle", {observability::IdField("bundle_id", model::IdToHex(*outcome.id))});
  }
  requested_.erase(*outcome.id);

  codec::ReceiptStatus status = codec::ReceiptStatus::kRejected;
  switch (outcome.status) {
    case IngestStatus::kStored:
      status = codec::ReceiptStatus::kStored;
      ++counters_.bundles_received;
      break;
    case IngestStatus::kCustodyAccepted:
      status = codec::ReceiptStatus::kCustodyAccepted;
      ++counters_.bundles_received;
      break;
    case IngestStatus::kDuplicate:
      status = codec::ReceiptStatus::kDuplicate;
      break;
    case IngestStatus::kRejected:
    case IngestStatus::kUndecodable:
      ++counters_.bundles_rejected;
      if (outcome.reason == store::RejectReason::kSignatureInvalid) {
        ++counters_.bad_signatures;
      }
      break;
  }

  Send(codec::ReceiptFrame{*outcome.id, status}, now_ms);
}

void NeighborSession::HandleReceipt(const codec::ReceiptFrame& frame, uint64_t now_ms) {
  if (outstanding_.erase(frame.id) == 0) {
    return;
  }
  host_.OnReceipt(frame.id, frame.status, *neighbor_, now_ms);
}

void NeighborSession::HandleEnd(uint64_t now_ms) {
  (void)now_ms;
  peer_round_open_ = false;
  requested_.clear();
}

void NeighborSession::MaybeIdle(uint64_t now_ms) {
  if (state_ != SessionState::kExchanging) return;
  if (own_round_open_ || peer_round_open_ || !outstanding_.empty()) return;

  state_ = SessionState::kIdle;
  COURIER_LOG_DEBUG("exchange complete", {observability::IdField("neighbor", neighbor_->node_id),
                                          observability::IntField("sent", static_cast<int64_t>(counters_.bundles_sent)),
                                          observability::IntField("received", static_cast<int64_t>(counters_.bundles_received)),
                                          observability::IntField("round_ms", static_cast<int64_t>(now_ms - round_started_ms_))});
}

void NeighborSession::Tick(uint64_t now_ms) {
  if (state_ == SessionState::kDisconnected || degraded_) return;

  if (state_ == SessionState::kIdle) {
    if (now_ms >= round_started_ms_ + static_cast<uint64_t>(options_.exchange_interval.count())) {
      BeginRound(now_ms);
    }
    return;
  }

  if (now_ms > last_activity_ms_ + static_cast<uint64_t>(options_.exchange_timeout.count())) {
    Disconnect(now_ms, state_ == SessionState::kHandshaking ? "handshake timeout" : "exchange timeout");
  }
}

void NeighborSession::OnDisconnected(uint64_t now_ms) {
  if (state_ == SessionState::kDisconnected) return;
  state_ = SessionState::kDisconnected;

  if (neighbor_) {
    for (const auto& id : outstanding_) {
      host_.OnUnreceipted(id, *neighbor_, now_ms);
    }
  }
  outstanding_.clear();
  own_round_open_  = false;
  peer_round_open_ = false;
  requested_.clear();

  observability::Metrics::Instance().RecordContact(counters_.bundles_sent, counters_.bundles_received);
}

void NeighborSession::Disconnect(uint64_t now_ms, std::string_view why) {
  if (state_ == SessionState::kDisconnected) return;
  COURIER_LOG_WARN("neighbor session closed", {observability::StringField("link", link_.Describe()), observability::StringField("reason", why)});
  OnDisconnected(now_ms);
  link_.Close();
}

} // namespace courier::propagation
